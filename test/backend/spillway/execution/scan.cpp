#include <algorithm>

#include "test/shared/exec_test.hpp"
#include "spillway/execution/scan.hpp"
#include "spillway/utils/validation.hpp"

class ScanFixture : public ExecTestFixture {
public:
    std::shared_ptr<InMemoryRelation> t1;

protected:
    void SetUp() override {
        ExecTestFixture::SetUp();
        Schema schema({ ColumnDefinition("t1.c1", ValueType::Integer), ColumnDefinition("t1.c2", ValueType::Text) });
        std::vector<Row> rows;
        for (int64_t i = 0; i < 10; i++)
            rows.push_back(Row({ Value::integer(i), Value::text("v" + std::to_string(i % 3)) }));
        t1 = createRelation(schema, rows);
    }
};

TEST_F(ScanFixture, sequential_scan) {
    TableScan scan(*context, t1);
    std::vector<Row> expected;
    for (int64_t i = 0; i < 10; i++)
        expected.push_back(Row({ Value::integer(i), Value::text("v" + std::to_string(i % 3)) }));
    ASSERT_TRUE(validateQueryResult(scan, expected, true));
    EXPECT_EQ(scan.getBlocksScanned(), 3ul);
    EXPECT_EQ(scan.getStats().rows_produced, 10ul);
}

TEST_F(ScanFixture, reinvocation) {
    TableScan scan(*context, t1);
    Row row;
    EXPECT_THROW(scan.next(row), std::runtime_error);
    scan.open();
    EXPECT_THROW(scan.open(), std::runtime_error);
    size_t count = 0;
    while (scan.next(row))
        count++;
    EXPECT_EQ(count, 10ul);
    // an exhausted operator keeps returning false until it is re-invoked
    EXPECT_FALSE(scan.next(row));
    EXPECT_TRUE(scan.isOpen());
    scan.close();
    scan.close();
    EXPECT_EQ(collectRows(scan).size(), 10ul);
    EXPECT_EQ(scan.getStats().opens, 2ul);
}

TEST_F(ScanFixture, next_block) {
    TableScan scan(*context, t1);
    MemoryBudget budget(1, "consumer");
    Block block(budget, 4);
    scan.open();
    std::vector<size_t> sizes;
    while (scan.nextBlock(block))
        sizes.push_back(block.getCurrentSize());
    scan.close();
    EXPECT_EQ(sizes, std::vector<size_t>({ 4, 4, 2 }));
}

TEST_F(ScanFixture, sorted_scan) {
    EXPECT_FALSE(t1->isSortedOn({ 0 }));
    EXPECT_THROW(TableScan invalid(*context, t1, { 0 }), std::runtime_error);
    t1->setSortedOn({ 0 });
    EXPECT_TRUE(t1->isSortedOn({ 0 }));
    EXPECT_FALSE(t1->isSortedOn({ 1 }));
    TableScan scan(*context, t1, { 0 });
    EXPECT_EQ(collectRows(scan).size(), 10ul);
    // column 1 is not ordered
    EXPECT_THROW(t1->setSortedOn({ 1 }), std::runtime_error);
}

TEST_F(ScanFixture, index_lookup) {
    EXPECT_THROW(t1->indexLookup({ 1 }, Row({ Value::text("v1") })), std::runtime_error);
    t1->createIndex({ 1 });
    ASSERT_TRUE(t1->hasIndexOn({ 1 }));
    auto matches = t1->indexLookup({ 1 }, Row({ Value::text("v1") }));
    std::vector<int64_t> ids;
    Row row;
    while (matches->next(row))
        ids.push_back(row[0].getInteger());
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, std::vector<int64_t>({ 1, 4, 7 }));

    // rows appended later are indexed as well
    t1->append(Row({ Value::integer(10), Value::text("v1") }));
    ids.clear();
    matches = t1->indexLookup({ 1 }, Row({ Value::text("v1") }));
    while (matches->next(row))
        ids.push_back(row[0].getInteger());
    EXPECT_EQ(ids.size(), 4ul);
}

TEST_F(ScanFixture, arity_mismatch) {
    EXPECT_THROW(t1->append(ints({ 1 })), std::runtime_error);
}
