#include "test/shared/exec_test.hpp"
#include "spillway/core/errors.hpp"
#include "spillway/execution/filter.hpp"
#include "spillway/execution/materialize.hpp"
#include "spillway/execution/projection.hpp"
#include "spillway/execution/scan.hpp"
#include "spillway/utils/validation.hpp"

class PipelineFixture : public ExecTestFixture {
public:
    const Schema schema = Schema({ ColumnDefinition("a", ValueType::Integer), ColumnDefinition("b", ValueType::Integer), ColumnDefinition("c", ValueType::Text) });

protected:
    std::shared_ptr<InMemoryRelation> numbers(int64_t count) const {
        std::vector<Row> rows;
        for (int64_t i = 0; i < count; i++)
            rows.push_back(Row({ Value::integer(i), Value::integer(i * i), Value::text("n" + std::to_string(i)) }));
        return createRelation(schema, rows);
    }
};

TEST_F(PipelineFixture, filter) {
    Filter filter(*context, scan(numbers(10)), [](const Row& row) { return row[0].getInteger() % 3 == 0; });
    ASSERT_TRUE(validateQueryResult(filter, {
        Row({ Value::integer(0), Value::integer(0), Value::text("n0") }),
        Row({ Value::integer(3), Value::integer(9), Value::text("n3") }),
        Row({ Value::integer(6), Value::integer(36), Value::text("n6") }),
        Row({ Value::integer(9), Value::integer(81), Value::text("n9") })
    }, true));
    EXPECT_EQ(filter.getRowsRejected(), 6ul);
    EXPECT_EQ(filter.getSchema().size(), 3ul);
    EXPECT_THROW(Filter invalid(*context, scan(numbers(1)), nullptr), std::runtime_error);
}

TEST_F(PipelineFixture, projection) {
    Projection projection(*context, scan(numbers(3)), { 2, 0 }, { "name", "id" });
    ASSERT_EQ(projection.getSchema().size(), 2ul);
    EXPECT_EQ(projection.getSchema().getColumns()[0].name, "name");
    EXPECT_EQ(projection.getSchema().getColumns()[0].type, ValueType::Text);
    EXPECT_EQ(projection.getSchema().getColumns()[1].name, "id");
    ASSERT_TRUE(validateQueryResult(projection, {
        Row({ Value::text("n0"), Value::integer(0) }),
        Row({ Value::text("n1"), Value::integer(1) }),
        Row({ Value::text("n2"), Value::integer(2) })
    }, true));

    Projection keep_names(*context, scan(numbers(1)), { 1 });
    EXPECT_EQ(keep_names.getSchema().getColumns()[0].name, "b");

    EXPECT_THROW(Projection invalid(*context, scan(numbers(1)), { 0, 1 }, { "x" }), std::runtime_error);
    EXPECT_THROW(Projection invalid(*context, scan(numbers(1)), { 3 }), std::runtime_error);
}

TEST_F(PipelineFixture, limit) {
    auto input = scan(numbers(20));
    Limit limit(*context, input, 4);
    std::vector<Row> result = collectRows(limit);
    ASSERT_EQ(result.size(), 4ul);
    for (int64_t i = 0; i < 4; i++)
        EXPECT_EQ(result[i][0].getInteger(), i);
    EXPECT_EQ(input->getStats().opens, 1ul);

    Limit larger(*context, scan(numbers(3)), 10);
    EXPECT_EQ(collectRows(larger).size(), 3ul);

    // a limit of zero never touches its input
    auto untouched = scan(numbers(5));
    Limit zero(*context, untouched, 0);
    EXPECT_TRUE(collectRows(zero).empty());
    EXPECT_EQ(untouched->getStats().opens, 0ul);
}

TEST_F(PipelineFixture, materialize_in_memory) {
    configure(4, 4);
    auto input = scan(numbers(10));
    Materialize materialize(*context, input, 4);
    for (size_t pass = 0; pass < 3; pass++) {
        std::vector<Row> result = collectRows(materialize);
        ASSERT_EQ(result.size(), 10ul);
        EXPECT_EQ(result[9][2].getText(), "n9");
        EXPECT_TRUE(materialize.isCached());
        EXPECT_FALSE(materialize.isSpilled());
    }
    EXPECT_EQ(materialize.getInputPasses(), 1ul);
    EXPECT_EQ(input->getStats().opens, 1ul);
    EXPECT_EQ(materialize.getMemoryBudget().getPeakBlocksInUse(), 3ul);
    EXPECT_EQ(getLivePartitionCount(), 0ul);
}

TEST_F(PipelineFixture, materialize_spilled) {
    configure(2, 4);
    auto input = scan(numbers(25));
    Materialize materialize(*context, input, 3);
    ASSERT_EQ(collectRows(materialize).size(), 25ul);
    EXPECT_TRUE(materialize.isSpilled());
    // the spilled cache outlives close()
    EXPECT_EQ(getLivePartitionCount(), 1ul);
    std::vector<Row> replay = collectRows(materialize);
    ASSERT_EQ(replay.size(), 25ul);
    for (int64_t i = 0; i < 25; i++)
        EXPECT_EQ(replay[i][0].getInteger(), i);
    EXPECT_EQ(materialize.getInputPasses(), 1ul);
    EXPECT_LE(materialize.getMemoryBudget().getPeakBlocksInUse(), 3ul);
    EXPECT_EQ(materialize.getMemoryBudget().getViolationCount(), 0ul);

    materialize.discardCache();
    EXPECT_FALSE(materialize.isCached());
    EXPECT_EQ(getLivePartitionCount(), 0ul);
    EXPECT_EQ(collectRows(materialize).size(), 25ul);
    EXPECT_EQ(materialize.getInputPasses(), 2ul);
    materialize.discardCache();
}

TEST_F(PipelineFixture, materialize_closed_early) {
    configure(2, 4);
    Materialize materialize(*context, scan(numbers(25)), 3);
    materialize.open();
    Row row;
    ASSERT_TRUE(materialize.next(row));
    materialize.close();
    EXPECT_TRUE(materialize.isCached());
    materialize.discardCache();
    EXPECT_EQ(getLivePartitionCount(), 0ul);
    EXPECT_THROW(Materialize invalid(*context, scan(numbers(1)), 0), ConfigurationError);
}
