#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "operator.hpp"

class BlockCursor {
public:
    virtual ~BlockCursor() { }

    // returns the next block of rows or nullptr at the end; the block stays valid until the next call
    virtual const std::vector<Row>* nextBlock() = 0;
};

// a relation as a sequence of blocks, provided by the storage layer
class BlockSource {
public:
    virtual ~BlockSource() { }

    virtual const Schema& getSchema() const = 0;
    virtual std::unique_ptr<BlockCursor> scan() const = 0;

    virtual bool isSortedOn(const std::vector<size_t>& key) const;
    // blocks ordered by 'key', only available if isSortedOn(key)
    virtual std::unique_ptr<BlockCursor> scanSorted(const std::vector<size_t>& key) const;

    virtual bool hasIndexOn(const std::vector<size_t>& key) const;
    // rows whose 'key' columns equal 'key_value', only available if hasIndexOn(key)
    virtual std::unique_ptr<RowSource> indexLookup(const std::vector<size_t>& key, const Row& key_value) const;
};

class InMemoryRelation : public BlockSource {
public:
    InMemoryRelation(const Schema& schema, size_t block_capacity);

    void append(const Row& row);
    void append(const std::vector<Row>& rows);
    // declares the relation ordered by 'key'; throws if the rows are not
    void setSortedOn(const std::vector<size_t>& key);
    void createIndex(const std::vector<size_t>& key);

    size_t getRowCount() const { return row_count; }
    size_t getBlockCount() const { return blocks.size(); }

    const Schema& getSchema() const override { return schema; }
    std::unique_ptr<BlockCursor> scan() const override;
    bool isSortedOn(const std::vector<size_t>& key) const override;
    std::unique_ptr<BlockCursor> scanSorted(const std::vector<size_t>& key) const override;
    bool hasIndexOn(const std::vector<size_t>& key) const override;
    std::unique_ptr<RowSource> indexLookup(const std::vector<size_t>& key, const Row& key_value) const override;

private:
    const Schema schema;
    const size_t block_capacity;
    std::vector<std::vector<Row>> blocks;
    size_t row_count;
    std::vector<size_t> sorted_on;
    std::vector<size_t> index_key;
    std::multimap<std::string, Row> index; // canonical key encoding -> row
};

class TableScan : public OperatorBase {
public:
    // uses the sorted scan of 'source' if 'sorted_key' is not empty
    TableScan(ExecutionContext& context, std::shared_ptr<BlockSource> source, const std::vector<size_t>& sorted_key = {});

    size_t getBlocksScanned() const { return blocks_scanned; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    const std::shared_ptr<BlockSource> source;
    const std::vector<size_t> sorted_key;
    std::unique_ptr<BlockCursor> cursor;
    const std::vector<Row>* current_block;
    size_t position;
    size_t blocks_scanned;
};

// reads a partition owned by someone else, e.g. a bucket of a hash join
class PartitionScan : public OperatorBase {
public:
    PartitionScan(ExecutionContext& context, Partition& partition, const Schema& schema);

    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    Partition& partition;
    std::unique_ptr<PartitionReader> reader;
};
