#include <fcntl.h>
#include <limits>
#include <unistd.h>

#include "test/shared/exec_test.hpp"
#include "spillway/core/engine.hpp"
#include "spillway/core/errors.hpp"
#include "spillway/storage/row_serializer.hpp"
#include "spillway/storage/temp_store.hpp"

class TempStoreFixture : public ExecTestFixture {
public:
    std::unique_ptr<MemoryBudget> budget;
    IOStats io;

protected:
    void SetUp() override {
        ExecTestFixture::SetUp();
        budget = std::make_unique<MemoryBudget>(4, "test");
    }

    Partition createPartition(const std::string& name) {
        return engine->temp_store.createPartition(name, *budget, engine->config.block_capacity, io);
    }

    static std::vector<Row> readAll(Partition& partition) {
        std::vector<Row> rows;
        auto reader = partition.scan();
        Row row;
        while (reader->next(row))
            rows.push_back(row);
        return rows;
    }
};

TEST_F(TempStoreFixture, append_and_scan) {
    std::vector<Row> expected;
    for (int64_t i = 0; i < 10; i++)
        expected.push_back(Row({ Value::integer(i), Value::text("row" + std::to_string(i)), i % 3 == 0 ? Value::null() : Value::floating(i * 0.5) }));
    {
        Partition partition = createPartition("rows");
        for (auto& row : expected)
            partition.append(row);
        EXPECT_TRUE(partition.hasWriteBuffer());
        partition.finishWriting();
        EXPECT_FALSE(partition.hasWriteBuffer());
        EXPECT_EQ(budget->getBlocksInUse(), 0ul);
        EXPECT_EQ(partition.getRowCount(), 10ul);
        EXPECT_EQ(partition.getBlockCount(), 3ul); // 4 rows per block
        EXPECT_EQ(io.blocks_written, 3ul);

        EXPECT_EQ(readAll(partition), expected);
        EXPECT_EQ(io.blocks_read, 3ul);
        // a finished partition can be scanned repeatedly
        EXPECT_EQ(readAll(partition), expected);
        EXPECT_EQ(budget->getPeakBlocksInUse(), 1ul);
        EXPECT_EQ(getLivePartitionCount(), 1ul);
        EXPECT_EQ(getScratchFileCount(), 1ul);
    }
    EXPECT_EQ(getLivePartitionCount(), 0ul);
    EXPECT_EQ(getScratchFileCount(), 0ul);
}

TEST_F(TempStoreFixture, empty_partition) {
    Partition partition = createPartition("empty");
    partition.finishWriting();
    EXPECT_EQ(partition.getBlockCount(), 0ul);
    EXPECT_TRUE(readAll(partition).empty());
}

TEST_F(TempStoreFixture, write_phase) {
    Partition partition = createPartition("phases");
    partition.append(ints({ 1 }));
    EXPECT_THROW(partition.scan(), std::runtime_error);
    partition.finishWriting();
    EXPECT_THROW(partition.append(ints({ 2 })), std::runtime_error);
    partition.drop();
    EXPECT_FALSE(partition.isValid());
    EXPECT_THROW(partition.scan(), std::runtime_error);
    EXPECT_EQ(getScratchFileCount(), 0ul);
}

TEST_F(TempStoreFixture, move_transfers_ownership) {
    Partition first = createPartition("moved");
    first.append(ints({ 7 }));
    Partition second = std::move(first);
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    first.drop(); // no-op on a moved-from handle
    EXPECT_EQ(getLivePartitionCount(), 1ul);
    second.finishWriting();
    EXPECT_EQ(readAll(second), std::vector<Row>({ ints({ 7 }) }));

    Partition third = createPartition("replaced");
    third = std::move(second); // drops the partition 'third' held before
    EXPECT_EQ(getLivePartitionCount(), 1ul);
}

TEST_F(TempStoreFixture, write_block_bypasses_buffer) {
    Partition partition = createPartition("blocks");
    {
        Block block(*budget, engine->config.block_capacity);
        block.addRow(ints({ 1 }));
        block.addRow(ints({ 2 }));
        partition.writeBlock(block);
    }
    EXPECT_FALSE(partition.hasWriteBuffer());
    partition.append(ints({ 3 }));
    partition.finishWriting();
    EXPECT_EQ(readAll(partition), std::vector<Row>({ ints({ 1 }), ints({ 2 }), ints({ 3 }) }));
}

TEST_F(TempStoreFixture, statement_scope_reclaims) {
    Partition survivor;
    {
        StatementScope scope(*engine);
        survivor = createPartition("leaked");
        survivor.append(ints({ 1 }));
        Partition other = createPartition("other");
        other.finishWriting();
        EXPECT_EQ(getLivePartitionCount(), 2ul);
        // 'other' is dropped here, 'survivor' is reclaimed by the scope
    }
    EXPECT_EQ(getLivePartitionCount(), 0ul);
    EXPECT_EQ(getScratchFileCount(), 0ul);
    // dropping a reclaimed partition is harmless
    survivor.drop();
}

TEST_F(TempStoreFixture, corrupted_record) {
    Partition partition = createPartition("corrupt");
    partition.append(ints({ 1, 2, 3 }));
    partition.finishWriting();

    const std::string file = path + "/corrupt.0.part";
    int fd = open(file.c_str(), O_WRONLY);
    ASSERT_GE(fd, 0);
    const char garbage[8] = { 'g', 'a', 'r', 'b', 'a', 'g', 'e', '!' };
    ASSERT_EQ(pwrite(fd, garbage, sizeof(garbage), 0), static_cast<ssize_t>(sizeof(garbage)));
    close(fd);

    auto reader = partition.scan();
    Row row;
    EXPECT_THROW(reader->next(row), ResourceError);
}

TEST_F(TempStoreFixture, writer_cache_limits_buffers) {
    std::vector<Partition> partitions;
    for (size_t i = 0; i < 3; i++)
        partitions.push_back(createPartition("p" + std::to_string(i)));
    {
        PartitionWriterCache writers(2);
        for (int64_t i = 0; i < 30; i++)
            writers.append(partitions[i % 3], ints({ i }));
        writers.clear();
    }
    EXPECT_LE(budget->getPeakBlocksInUse(), 2ul);
    for (auto& partition : partitions)
        partition.finishWriting();
    EXPECT_EQ(budget->getBlocksInUse(), 0ul);

    for (size_t p = 0; p < 3; p++) {
        std::vector<Row> expected;
        for (int64_t i = static_cast<int64_t>(p); i < 30; i += 3)
            expected.push_back(ints({ i }));
        EXPECT_EQ(readAll(partitions[p]), expected);
    }
}

TEST_F(TempStoreFixture, descriptors_are_recycled) {
    configure(4, 4, DEFAULT_HASH_MAX_DEPTH, 2);
    std::vector<Partition> partitions;
    for (int64_t p = 0; p < 6; p++) {
        partitions.push_back(createPartition("p" + std::to_string(p)));
        EXPECT_LE(engine->temp_store.getOpenFileCount(), 2ul);
    }
    // interleaved writes force the files to be reopened
    for (int64_t i = 0; i < 10; i++) {
        for (int64_t p = 0; p < 6; p++) {
            partitions[p].append(ints({ p, i }));
            partitions[p].releaseWriteBuffer();
        }
    }
    for (auto& partition : partitions)
        partition.finishWriting();
    EXPECT_GT(engine->temp_store.getReopenCount(), 0ul);
    EXPECT_LE(engine->temp_store.getOpenFileCount(), 2ul);
    EXPECT_EQ(getScratchFileCount(), 6ul);

    for (int64_t p = 5; p >= 0; p--) {
        std::vector<Row> rows = readAll(partitions[p]);
        ASSERT_EQ(rows.size(), 10ul);
        for (int64_t i = 0; i < 10; i++)
            EXPECT_EQ(rows[i], ints({ p, i }));
    }
    partitions[3].drop();
    EXPECT_EQ(getLivePartitionCount(), 5ul);
    partitions.clear();
    EXPECT_EQ(engine->temp_store.getOpenFileCount(), 0ul);
    EXPECT_EQ(getScratchFileCount(), 0ul);
}

TEST(RowSerializer, group_key_canonical) {
    std::string a, b, c;
    encodeGroupKey(Row({ Value::integer(5), Value::null() }), { 0, 1 }, a);
    encodeGroupKey(Row({ Value::floating(5.0), Value::null() }), { 0, 1 }, b);
    encodeGroupKey(Row({ Value::integer(5), Value::integer(0) }), { 0, 1 }, c);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);

    std::string nan_a, nan_b, large;
    encodeGroupKey(Row({ Value::floating(std::numeric_limits<double>::quiet_NaN()) }), { 0 }, nan_a);
    encodeGroupKey(Row({ Value::floating(-std::numeric_limits<double>::quiet_NaN()) }), { 0 }, nan_b);
    EXPECT_EQ(nan_a, nan_b);
    encodeGroupKey(Row({ Value::floating(9223372036854775808.0) }), { 0 }, large);
    std::string max;
    encodeGroupKey(Row({ Value::integer(std::numeric_limits<int64_t>::max()) }), { 0 }, max);
    EXPECT_NE(large, max);
}

TEST(RowSerializer, truncated_input) {
    std::string buffer;
    serializeRow(Row({ Value::text("hello"), Value::integer(1) }), buffer);
    const char* pos = buffer.data();
    EXPECT_THROW(deserializeRow(pos, buffer.data() + buffer.size() - 3), ResourceError);
}
