#include "scan.hpp"

#include <stdexcept>

#include "key.hpp"
#include "../storage/row_serializer.hpp"

namespace {

class VectorBlockCursor : public BlockCursor {
public:
    explicit VectorBlockCursor(const std::vector<std::vector<Row>>& blocks) : blocks(blocks), position(0) { }

    const std::vector<Row>* nextBlock() override {
        if (position >= blocks.size())
            return nullptr;
        return &blocks[position++];
    }

private:
    const std::vector<std::vector<Row>>& blocks;
    size_t position;
};

class VectorRowSource : public RowSource {
public:
    explicit VectorRowSource(std::vector<Row>&& rows) : rows(std::move(rows)), position(0) { }

    bool next(Row& row) override {
        if (position >= rows.size())
            return false;
        row = std::move(rows[position++]);
        return true;
    }

private:
    std::vector<Row> rows;
    size_t position;
};

bool isPrefix(const std::vector<size_t>& prefix, const std::vector<size_t>& columns) {
    if (prefix.empty() || prefix.size() > columns.size())
        return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (prefix[i] != columns[i])
            return false;
    }
    return true;
}

}

bool BlockSource::isSortedOn(const std::vector<size_t>&) const {
    return false;
}

std::unique_ptr<BlockCursor> BlockSource::scanSorted(const std::vector<size_t>&) const {
    throw std::runtime_error("Relation does not support sorted scans");
}

bool BlockSource::hasIndexOn(const std::vector<size_t>&) const {
    return false;
}

std::unique_ptr<RowSource> BlockSource::indexLookup(const std::vector<size_t>&, const Row&) const {
    throw std::runtime_error("Relation does not support index lookups");
}

InMemoryRelation::InMemoryRelation(const Schema& schema, size_t block_capacity)
    : schema(schema)
    , block_capacity(block_capacity)
    , row_count(0) {
    if (block_capacity == 0)
        throw std::runtime_error("Block capacity must be positive");
}

void InMemoryRelation::append(const Row& row) {
    if (row.size() != schema.size())
        throw std::runtime_error("Row arity " + std::to_string(row.size()) + " does not match the relation's " + std::to_string(schema.size()) + " columns");
    if (blocks.empty() || blocks.back().size() >= block_capacity) {
        blocks.emplace_back();
        blocks.back().reserve(block_capacity);
    }
    blocks.back().push_back(row);
    row_count++;
    if (!index_key.empty()) {
        std::string encoded;
        encodeGroupKey(row, index_key, encoded);
        index.emplace(encoded, row);
    }
}

void InMemoryRelation::append(const std::vector<Row>& rows) {
    for (auto& row : rows)
        append(row);
}

void InMemoryRelation::setSortedOn(const std::vector<size_t>& key) {
    const Row* previous = nullptr;
    for (auto& block : blocks) {
        for (auto& row : block) {
            if (previous && compareKeys(*previous, key, row, key) > 0)
                throw std::runtime_error("Relation is not sorted on the declared key");
            previous = &row;
        }
    }
    sorted_on = key;
}

void InMemoryRelation::createIndex(const std::vector<size_t>& key) {
    index_key = key;
    index.clear();
    for (auto& block : blocks) {
        for (auto& row : block) {
            std::string encoded;
            encodeGroupKey(row, index_key, encoded);
            index.emplace(encoded, row);
        }
    }
}

std::unique_ptr<BlockCursor> InMemoryRelation::scan() const {
    return std::make_unique<VectorBlockCursor>(blocks);
}

bool InMemoryRelation::isSortedOn(const std::vector<size_t>& key) const {
    return isPrefix(key, sorted_on);
}

std::unique_ptr<BlockCursor> InMemoryRelation::scanSorted(const std::vector<size_t>& key) const {
    if (!isSortedOn(key))
        throw std::runtime_error("Relation is not sorted on the requested key");
    return scan();
}

bool InMemoryRelation::hasIndexOn(const std::vector<size_t>& key) const {
    return !index_key.empty() && key == index_key;
}

std::unique_ptr<RowSource> InMemoryRelation::indexLookup(const std::vector<size_t>& key, const Row& key_value) const {
    if (!hasIndexOn(key))
        throw std::runtime_error("Relation has no index on the requested key");
    std::vector<size_t> value_columns;
    for (size_t i = 0; i < key_value.size(); i++)
        value_columns.push_back(i);
    std::string encoded;
    encodeGroupKey(key_value, value_columns, encoded);
    std::vector<Row> matches;
    auto range = index.equal_range(encoded);
    for (auto it = range.first; it != range.second; ++it)
        matches.push_back(it->second);
    return std::make_unique<VectorRowSource>(std::move(matches));
}

TableScan::TableScan(ExecutionContext& context, std::shared_ptr<BlockSource> source, const std::vector<size_t>& sorted_key)
    : OperatorBase(context, "table_scan", 1)
    , source(source)
    , sorted_key(sorted_key)
    , current_block(nullptr)
    , position(0)
    , blocks_scanned(0) {
    if (!source)
        throw std::runtime_error("TableScan requires a block source");
    if (!sorted_key.empty() && !source->isSortedOn(sorted_key))
        throw std::runtime_error("TableScan: source is not sorted on the requested key");
    schema = source->getSchema();
}

void TableScan::openImpl() {
    cursor = sorted_key.empty() ? source->scan() : source->scanSorted(sorted_key);
    current_block = nullptr;
    position = 0;
}

bool TableScan::nextImpl(Row& row) {
    while (current_block == nullptr || position >= current_block->size()) {
        current_block = cursor->nextBlock();
        if (current_block == nullptr)
            return false;
        blocks_scanned++;
        position = 0;
    }
    row = (*current_block)[position++];
    return true;
}

void TableScan::closeImpl() {
    cursor.reset();
    current_block = nullptr;
}

void TableScan::describe(std::ostream& out) const {
    out << (sorted_key.empty() ? "sequential" : "sorted") << ", blocks scanned: " << blocks_scanned;
}

PartitionScan::PartitionScan(ExecutionContext& context, Partition& partition, const Schema& schema)
    : OperatorBase(context, "partition_scan", 1)
    , partition(partition) {
    this->schema = schema;
}

void PartitionScan::openImpl() {
    reader = partition.scan(getBudget(), stats.io);
}

bool PartitionScan::nextImpl(Row& row) {
    return reader->next(row);
}

void PartitionScan::closeImpl() {
    reader.reset();
}

void PartitionScan::describe(std::ostream& out) const {
    out << partition.getName() << ", " << partition.getRowCount() << " rows";
}
