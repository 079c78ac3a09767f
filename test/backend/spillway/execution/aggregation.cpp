#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <sys/resource.h>

#include "test/shared/exec_test.hpp"
#include "spillway/core/errors.hpp"
#include "spillway/execution/aggregation.hpp"
#include "spillway/execution/projection.hpp"
#include "spillway/execution/scan.hpp"
#include "spillway/execution/sort.hpp"
#include "spillway/utils/validation.hpp"

// lowers the soft limit on open file descriptors while in scope
class DescriptorLimit {
public:
    explicit DescriptorLimit(rlim_t limit) {
        getrlimit(RLIMIT_NOFILE, &previous);
        struct rlimit lowered = previous;
        lowered.rlim_cur = std::min(limit, previous.rlim_max);
        applied = setrlimit(RLIMIT_NOFILE, &lowered) == 0;
    }

    ~DescriptorLimit() {
        if (applied)
            setrlimit(RLIMIT_NOFILE, &previous);
    }

    bool isApplied() const { return applied; }

private:
    struct rlimit previous;
    bool applied;
};

class AggregationFixture : public ExecTestFixture {
public:
    const Schema schema = Schema({ ColumnDefinition("k", ValueType::Integer), ColumnDefinition("v", ValueType::Integer) });

protected:
    static Row kv(int64_t k, const Value& v) {
        return Row({ Value::integer(k), v });
    }
};

TEST_F(AggregationFixture, distinct_scenario) {
    configure(1, 4);
    auto t1 = createRelation(schema, { ints({ 1, 5 }), ints({ 1, 5 }), ints({ 1, 3 }), ints({ 2, 7 }) });
    Aggregation aggregation(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Sum, 1), AggregateSpec(AggregateFunction::Min, 1, true) }, 4);
    ASSERT_TRUE(validateQueryResult(aggregation, { ints({ 1, 13, 3 }), ints({ 2, 7, 7 }) }));
    EXPECT_TRUE(aggregation.usesGroupPartitions());
    EXPECT_EQ(aggregation.getGroupCount(), 2ul);
    EXPECT_EQ(aggregation.getSchema().getColumns()[2].name, "min(distinct v)");
    EXPECT_LE(aggregation.getMemoryBudget().getPeakBlocksInUse(), 4ul);
    EXPECT_EQ(aggregation.getMemoryBudget().getViolationCount(), 0ul);
}

TEST_F(AggregationFixture, incremental_functions) {
    auto t1 = createRelation(schema, { ints({ 1, 2 }), ints({ 1, 4 }), ints({ 1, 4 }), ints({ 1, 4 }), ints({ 2, 5 }), ints({ 2, 5 }), ints({ 2, 7 }), ints({ 2, 9 }), kv(2, Value::null()) });
    std::vector<AggregateSpec> aggregates = {
        AggregateSpec(AggregateFunction::CountStar),
        AggregateSpec(AggregateFunction::Count, 1),
        AggregateSpec(AggregateFunction::Sum, 1),
        AggregateSpec(AggregateFunction::Min, 1),
        AggregateSpec(AggregateFunction::Max, 1),
        AggregateSpec(AggregateFunction::Avg, 1, false, "average"),
    };
    Aggregation aggregation(*context, scan(t1), { 0 }, aggregates, 1);
    ASSERT_TRUE(validateQueryResult(aggregation, {
        Row({ Value::integer(1), Value::integer(4), Value::integer(4), Value::integer(14), Value::integer(2), Value::integer(4), Value::floating(3.5) }),
        Row({ Value::integer(2), Value::integer(5), Value::integer(4), Value::integer(26), Value::integer(5), Value::integer(9), Value::floating(6.5) }),
    }));
    EXPECT_FALSE(aggregation.usesGroupPartitions());
    EXPECT_EQ(engine->temp_store.getCreatedPartitionCount(), 0ul);
    EXPECT_EQ(aggregation.getSchema().getColumns()[6].name, "average");
    EXPECT_EQ(aggregation.getMemoryBudget().getPeakBlocksInUse(), 1ul);
}

TEST_F(AggregationFixture, stddev_pop) {
    std::vector<Row> rows;
    for (int64_t v : { 2, 4, 4, 4, 5, 5, 7, 9 })
        rows.push_back(ints({ 0, v }));
    Aggregation aggregation(*context, scan(createRelation(schema, rows)), {}, { AggregateSpec(AggregateFunction::StddevPop, 1) }, 1);
    std::vector<Row> result = collectRows(aggregation);
    ASSERT_EQ(result.size(), 1ul);
    EXPECT_NEAR(result[0][0].getFloat(), 2.0, 1e-9);
}

TEST_F(AggregationFixture, sum_types) {
    Schema mixed({ ColumnDefinition("k", ValueType::Integer), ColumnDefinition("v", ValueType::Float) });
    auto t1 = createRelation(mixed, { kv(1, Value::integer(1)), kv(1, Value::floating(2.5)), kv(2, Value::integer(3)), kv(2, Value::integer(4)), kv(3, Value::null()) });
    Aggregation aggregation(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Sum, 1) }, 1);
    ASSERT_TRUE(validateQueryResult(aggregation, { kv(1, Value::floating(3.5)), kv(2, Value::integer(7)), kv(3, Value::null()) }));
}

TEST_F(AggregationFixture, sum_overflow) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    auto t1 = createRelation(schema, { ints({ 1, max }), ints({ 1, 1 }), ints({ 2, min }), ints({ 2, -1 }), ints({ 3, max }), ints({ 3, -1 }), ints({ 3, 1 }) });
    Aggregation aggregation(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Sum, 1) }, 1);
    // 2^63 + 1 and -2^63 - 1 round to the nearest double
    ASSERT_TRUE(validateQueryResult(aggregation, { kv(1, Value::floating(9223372036854775808.0)), kv(2, Value::floating(-9223372036854775808.0)), ints({ 3, max }) }));

    Aggregation distinct(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Sum, 1, true) }, 4);
    ASSERT_TRUE(validateQueryResult(distinct, { kv(1, Value::floating(9223372036854775808.0)), kv(2, Value::floating(-9223372036854775808.0)), ints({ 3, max }) }));
}

TEST_F(AggregationFixture, scalar_aggregate_over_empty_input) {
    auto t1 = createRelation(schema, {});
    Aggregation incremental(*context, scan(t1), {}, { AggregateSpec(AggregateFunction::CountStar), AggregateSpec(AggregateFunction::Sum, 1), AggregateSpec(AggregateFunction::Avg, 1) }, 1);
    ASSERT_TRUE(validateQueryResult(incremental, { Row({ Value::integer(0), Value::null(), Value::null() }) }));

    Aggregation distinct(*context, scan(t1), {}, { AggregateSpec(AggregateFunction::Count, 1, true), AggregateSpec(AggregateFunction::Max, 1, true) }, 4);
    ASSERT_TRUE(validateQueryResult(distinct, { Row({ Value::integer(0), Value::null() }) }));

    Aggregation grouped(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar) }, 1);
    EXPECT_TRUE(collectRows(grouped).empty());
}

TEST_F(AggregationFixture, null_group) {
    auto t1 = createRelation(schema, { Row({ Value::null(), Value::integer(1) }), Row({ Value::null(), Value::integer(2) }), ints({ 1, 3 }) });
    Aggregation incremental(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar) }, 1);
    ASSERT_TRUE(validateQueryResult(incremental, { Row({ Value::null(), Value::integer(2) }), ints({ 1, 1 }) }));

    Aggregation distinct(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Count, 1, true) }, 4);
    ASSERT_TRUE(validateQueryResult(distinct, { Row({ Value::null(), Value::integer(2) }), ints({ 1, 1 }) }));
}

TEST_F(AggregationFixture, having) {
    auto t1 = createRelation(schema, { ints({ 1, 1 }), ints({ 1, 2 }), ints({ 2, 3 }), ints({ 3, 4 }), ints({ 3, 4 }) });
    auto at_least_two = [](const Row& row) { return row[1].getInteger() >= 2; };
    Aggregation incremental(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar) }, 1, at_least_two);
    ASSERT_TRUE(validateQueryResult(incremental, { ints({ 1, 2 }), ints({ 3, 2 }) }));

    Aggregation distinct(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Count, 1, true) }, 4, at_least_two);
    ASSERT_TRUE(validateQueryResult(distinct, { ints({ 1, 2 }) }));

    Aggregation scalar(*context, scan(createRelation(schema, {})), {}, { AggregateSpec(AggregateFunction::CountStar) }, 1, [](const Row& row) { return row[0].getInteger() > 0; });
    EXPECT_TRUE(collectRows(scalar).empty());
}

TEST_F(AggregationFixture, distinct_coerces_values) {
    Schema mixed({ ColumnDefinition("k", ValueType::Integer), ColumnDefinition("v", ValueType::Float) });
    auto t1 = createRelation(mixed, { kv(1, Value::integer(1)), kv(1, Value::floating(1.0)), kv(1, Value::integer(2)), kv(1, Value::null()) });
    Aggregation aggregation(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Count, 1, true), AggregateSpec(AggregateFunction::Count, 1), AggregateSpec(AggregateFunction::CountStar) }, 4);
    ASSERT_TRUE(validateQueryResult(aggregation, { ints({ 1, 2, 3, 4 }) }));
}

TEST_F(AggregationFixture, count_distinct_equivalence) {
    configure(2, 4);
    std::vector<Row> rows;
    std::map<int64_t, std::set<int64_t>> distinct_values;
    for (int64_t i = 0; i < 200; i++) {
        if (i % 17 == 0) {
            rows.push_back(kv(i % 3, Value::null()));
            continue;
        }
        rows.push_back(ints({ i % 3, (i * 7) % 23 }));
        distinct_values[i % 3].insert((i * 7) % 23);
    }
    auto t1 = createRelation(schema, rows);

    Aggregation distinct(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Count, 1, true) }, 4);
    std::vector<Row> result = collectRows(distinct);
    EXPECT_GT(distinct.getDistinctSortRuns(), 0ul);
    EXPECT_LE(distinct.getMemoryBudget().getPeakBlocksInUse(), 4ul);
    EXPECT_EQ(distinct.getMemoryBudget().getViolationCount(), 0ul);

    // deduplicate first, then count incrementally
    auto deduplicated = std::make_shared<SortOperator>(*context, std::make_shared<Projection>(*context, scan(t1), std::vector<size_t>({ 0, 1 })), std::vector<SortKey>({ SortKey(0) }), 4, true);
    Aggregation count(*context, deduplicated, { 0 }, { AggregateSpec(AggregateFunction::Count, 1) }, 4);
    ASSERT_TRUE(validateQueryResult(result, collectRows(count), distinct.getSchema()));

    std::vector<Row> expected;
    for (auto& entry : distinct_values)
        expected.push_back(ints({ entry.first, static_cast<int64_t>(entry.second.size()) }));
    ASSERT_TRUE(validateQueryResult(result, expected, distinct.getSchema()));
}

TEST_F(AggregationFixture, mixed_aggregates_many_groups) {
    configure(2, 4);
    std::vector<Row> rows;
    for (int64_t i = 0; i < 120; i++)
        rows.push_back(ints({ i % 10, i % 4 }));
    std::vector<AggregateSpec> aggregates = {
        AggregateSpec(AggregateFunction::CountStar),
        AggregateSpec(AggregateFunction::Sum, 1, true),
        AggregateSpec(AggregateFunction::Sum, 1),
        AggregateSpec(AggregateFunction::Avg, 1, true),
    };
    Aggregation aggregation(*context, scan(createRelation(schema, rows)), { 0 }, aggregates, 4);
    std::vector<Row> expected;
    for (int64_t k = 0; k < 10; k++) {
        // i % 10 == k fixes the parity of i, so every group sees two of the four values of i % 4
        const int64_t a = k % 2;
        const int64_t b = a + 2;
        expected.push_back(Row({ Value::integer(k), Value::integer(12), Value::integer(a + b), Value::integer(6 * (a + b)), Value::floating((a + b) / 2.0) }));
    }
    ASSERT_TRUE(validateQueryResult(aggregation, expected));
    EXPECT_EQ(aggregation.getGroupCount(), 10ul);
    EXPECT_LE(aggregation.getMemoryBudget().getPeakBlocksInUse(), 4ul);
    EXPECT_EQ(aggregation.getMemoryBudget().getViolationCount(), 0ul);
}

TEST_F(AggregationFixture, min_max_text) {
    Schema text_schema({ ColumnDefinition("k", ValueType::Integer), ColumnDefinition("s", ValueType::Text) });
    auto t1 = createRelation(text_schema, { kv(1, Value::text("b")), kv(1, Value::text("a")), kv(1, Value::text("c")) });
    Aggregation aggregation(*context, scan(t1), {}, { AggregateSpec(AggregateFunction::Min, 1), AggregateSpec(AggregateFunction::Max, 1, true) }, 4);
    ASSERT_TRUE(validateQueryResult(aggregation, { Row({ Value::text("a"), Value::text("c") }) }));
}

TEST_F(AggregationFixture, type_mismatch) {
    Schema text_schema({ ColumnDefinition("k", ValueType::Integer), ColumnDefinition("s", ValueType::Text) });
    auto t1 = createRelation(text_schema, { kv(1, Value::text("a")), kv(2, Value::text("b")) });
    Aggregation incremental(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Sum, 1) }, 1);
    EXPECT_THROW(collectRows(incremental), TypeMismatchError);

    Aggregation mixed(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Avg, 1), AggregateSpec(AggregateFunction::Count, 1, true) }, 4);
    EXPECT_THROW(collectRows(mixed), TypeMismatchError);
    EXPECT_FALSE(mixed.isOpen());
    EXPECT_GT(engine->temp_store.getCreatedPartitionCount(), 0ul);
    EXPECT_EQ(getLivePartitionCount(), 0ul);
}

TEST_F(AggregationFixture, invalid_configuration) {
    auto t1 = createRelation(schema, { ints({ 1, 1 }) });
    EXPECT_THROW(Aggregation invalid(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::Count, 1, true) }, 3), ConfigurationError);
    EXPECT_THROW(Aggregation invalid(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar) }, 0), ConfigurationError);
    EXPECT_THROW(Aggregation invalid(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar, 0, true) }, 4), std::runtime_error);
    EXPECT_THROW(Aggregation invalid(*context, scan(t1), { 2 }, { AggregateSpec(AggregateFunction::CountStar) }, 1), std::runtime_error);
}

TEST_F(AggregationFixture, more_groups_than_descriptors) {
    std::vector<Row> rows;
    std::vector<Row> expected;
    for (int64_t k = 0; k < 1000; k++) {
        rows.push_back(ints({ k, k % 3 }));
        rows.push_back(ints({ k, (k + 1) % 3 }));
        rows.push_back(ints({ k, k % 3 }));
        expected.push_back(ints({ k, 3, 2 }));
    }
    auto t1 = createRelation(schema, rows);
    Aggregation aggregation(*context, scan(t1), { 0 }, { AggregateSpec(AggregateFunction::CountStar), AggregateSpec(AggregateFunction::Count, 1, true) }, 4);
    std::vector<Row> result;
    {
        // fewer descriptors than the store would keep open on its own
        DescriptorLimit limit(32);
        ASSERT_TRUE(limit.isApplied());
        result = collectRows(aggregation);
    }
    ASSERT_TRUE(validateQueryResult(result, expected, aggregation.getSchema()));
    EXPECT_EQ(aggregation.getGroupCount(), 1000ul);
    EXPECT_GT(engine->temp_store.getReopenCount(), 0ul);
    EXPECT_LE(engine->temp_store.getOpenFileCount(), DEFAULT_MAX_OPEN_FILES);
}
