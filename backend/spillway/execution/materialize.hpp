#pragma once

#include <memory>
#include <vector>

#include "operator.hpp"

// Caches its input the first time it is opened and replays the cache on every later open, e.g. as the inner input
// of a block nested-loop join. The cache stays in memory while it fits into 'memory_blocks' blocks, otherwise it
// is spilled to a partition. Unlike other operators, closing keeps the cache; it lives until discardCache() is
// called or the operator is destroyed.
class Materialize : public OperatorBase {
public:
    Materialize(ExecutionContext& context, std::shared_ptr<OperatorBase> input, size_t memory_blocks);

    void discardCache();

    bool isCached() const { return cache_complete; }
    bool isSpilled() const { return spilled.isValid(); }
    size_t getInputPasses() const { return input_passes; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    void fillCache();

    const std::shared_ptr<OperatorBase> input;
    std::vector<std::unique_ptr<Block>> blocks;
    Partition spilled;
    bool cache_complete;
    size_t input_passes;

    // replay position
    std::unique_ptr<PartitionReader> reader;
    size_t block_index;
    size_t row_index;
};
