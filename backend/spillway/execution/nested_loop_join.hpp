#pragma once

#include <memory>
#include <vector>

#include "key.hpp"
#include "operator.hpp"

// Joins with an arbitrary predicate. Up to 'memory_blocks - 2' blocks of the outer input are buffered at a time and
// the inner input is re-invoked (closed and opened) once per outer chunk. The two remaining blocks hold the current
// inner block and the output.
class BlockNestedLoopJoin : public OperatorBase {
public:
    BlockNestedLoopJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> outer, std::shared_ptr<OperatorBase> inner, const JoinPredicate& predicate, size_t memory_blocks);

    size_t getInnerPassCount() const { return inner_passes; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    bool loadOuterChunk();
    bool fillOutput();

    const std::shared_ptr<OperatorBase> outer;
    const std::shared_ptr<OperatorBase> inner;
    const JoinPredicate predicate;
    const size_t max_chunk_blocks;
    std::vector<std::unique_ptr<Block>> outer_chunk;
    std::unique_ptr<Block> inner_block;
    std::unique_ptr<Block> output_block;
    size_t inner_position;
    size_t outer_block_index;
    size_t outer_row_index;
    size_t output_position;
    size_t inner_passes;
    size_t inner_rows_in_pass;
    bool done;
};
