#include "nested_loop_join.hpp"

#include "../core/errors.hpp"

BlockNestedLoopJoin::BlockNestedLoopJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> outer, std::shared_ptr<OperatorBase> inner, const JoinPredicate& predicate, size_t memory_blocks)
    : OperatorBase(context, "nested_loop_join", memory_blocks)
    , outer(outer)
    , inner(inner)
    , predicate(predicate)
    , max_chunk_blocks(memory_blocks >= 2 ? memory_blocks - 2 : 0)
    , inner_position(0)
    , outer_block_index(0)
    , outer_row_index(0)
    , output_position(0)
    , inner_passes(0)
    , inner_rows_in_pass(0)
    , done(false) {
    addChild(outer);
    addChild(inner);
    if (memory_blocks < 3)
        throw ConfigurationError("Block nested-loop join needs at least 3 memory blocks, got " + std::to_string(memory_blocks));
    if (!predicate)
        throw std::runtime_error("Block nested-loop join requires a join predicate");
    schema = Schema::concat(outer->getSchema(), inner->getSchema());
}

void BlockNestedLoopJoin::openImpl() {
    inner_passes = 0;
    done = false;
    inner_block = allocateBlock();
    output_block = allocateBlock();
    output_position = 0;
    outer->open();
    if (!loadOuterChunk()) {
        done = true;
        return;
    }
    inner->open();
    inner_passes++;
    inner_position = 0;
    inner_rows_in_pass = 0;
}

bool BlockNestedLoopJoin::loadOuterChunk() {
    size_t used = 0;
    while (used < max_chunk_blocks) {
        if (used == outer_chunk.size())
            outer_chunk.push_back(allocateBlock());
        if (!outer->nextBlock(*outer_chunk[used]))
            break;
        used++;
        if (!outer_chunk[used - 1]->full())
            break; // a partial block is only returned at the end of the input
    }
    outer_chunk.resize(used);
    outer_block_index = 0;
    outer_row_index = 0;
    return used > 0;
}

bool BlockNestedLoopJoin::fillOutput() {
    output_block->clear();
    output_position = 0;
    while (!output_block->full() && !done) {
        if (inner_position >= inner_block->getCurrentSize()) {
            if (!inner->nextBlock(*inner_block)) {
                // the inner input has been joined with the whole chunk, continue with the next one
                inner->close();
                if (inner_rows_in_pass == 0 || !loadOuterChunk()) {
                    done = true;
                    break;
                }
                inner->open();
                inner_passes++;
                inner_rows_in_pass = 0;
                inner_position = 0;
                continue;
            }
            inner_rows_in_pass += inner_block->getCurrentSize();
            inner_position = 0;
            outer_block_index = 0;
            outer_row_index = 0;
        }

        const Row& inner_row = inner_block->getRow(inner_position);
        while (outer_block_index < outer_chunk.size() && !output_block->full()) {
            Block& outer_block = *outer_chunk[outer_block_index];
            if (outer_row_index >= outer_block.getCurrentSize()) {
                outer_block_index++;
                outer_row_index = 0;
                continue;
            }
            const Row& outer_row = outer_block.getRow(outer_row_index++);
            if (predicate(outer_row, inner_row))
                output_block->addRow(concatRows(outer_row, inner_row));
        }
        if (outer_block_index >= outer_chunk.size()) {
            inner_position++;
            outer_block_index = 0;
            outer_row_index = 0;
        }
    }
    return !output_block->empty();
}

bool BlockNestedLoopJoin::nextImpl(Row& row) {
    if (output_position >= output_block->getCurrentSize()) {
        if (!fillOutput())
            return false;
    }
    row = std::move(output_block->getRow(output_position++));
    return true;
}

void BlockNestedLoopJoin::closeImpl() {
    outer_chunk.clear();
    inner_block.reset();
    output_block.reset();
}

void BlockNestedLoopJoin::describe(std::ostream& out) const {
    out << "outer chunk: " << max_chunk_blocks << " blocks, inner passes: " << inner_passes;
}
