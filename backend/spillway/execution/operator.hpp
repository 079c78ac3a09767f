#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../core/execution_context.hpp"
#include "../core/schema.hpp"
#include "../storage/block.hpp"
#include "../storage/memory_budget.hpp"
#include "../storage/temp_store.hpp"

#ifdef VTUNE_PROFILING
#include <ittnotify.h>
#endif

struct OperatorStats {
    size_t opens = 0;
    size_t next_calls = 0;
    size_t rows_produced = 0;
    IOStats io; // temporary partition blocks
};

// Pull-based physical operator. open() starts a new single-pass sequence of rows, next() produces them one at a
// time and close() releases every block, reader and temporary partition the operator holds. An exhausted operator
// releases its resources right away; producing the sequence again requires close() followed by open().
class OperatorBase : public RowSource {
public:
    OperatorBase(ExecutionContext& context, const std::string& type_name, size_t memory_blocks);
    virtual ~OperatorBase();

    OperatorBase(const OperatorBase& other) = delete;
    OperatorBase& operator=(const OperatorBase& other) = delete;

    void open();
    bool next(Row& row) override;
    // fills 'block' with up to its capacity of rows, returns false if no row was produced
    bool nextBlock(Block& block);
    void close();

    bool isOpen() const { return opened; }
    const Schema& getSchema() const { return schema; }
    const std::string& getName() const { return name; }
    size_t getMemoryBlocks() const { return memory_blocks; }
    const MemoryBudget& getMemoryBudget() const { return *budget; }
    const OperatorStats& getStats() const { return stats; }
    const std::vector<std::shared_ptr<OperatorBase>>& getChildren() const { return children; }

    // operator specific details for plan and statistics output
    virtual void describe(std::ostream& out) const;

protected:
    virtual void openImpl() = 0;
    virtual bool nextImpl(Row& row) = 0;
    // must release everything the operator holds and tolerate repeated calls
    virtual void closeImpl() = 0;

    void addChild(std::shared_ptr<OperatorBase> child);
    std::unique_ptr<Block> allocateBlock();
    Partition createPartition(const std::string& suffix);
    MemoryBudget& getBudget() { return *budget; }

    ExecutionContext& context;
    Schema schema;
    OperatorStats stats;

private:
    void release();

    const std::string name;
    const size_t memory_blocks;
    std::unique_ptr<MemoryBudget> budget;
    std::vector<std::shared_ptr<OperatorBase>> children;
    bool opened;
    bool exhausted;
#ifdef VTUNE_PROFILING
    __itt_string_handle* itt_handle;
#endif
};
