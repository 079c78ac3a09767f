#include "materialize.hpp"

#include "../core/errors.hpp"

Materialize::Materialize(ExecutionContext& context, std::shared_ptr<OperatorBase> input, size_t memory_blocks)
    : OperatorBase(context, "materialize", memory_blocks)
    , input(input)
    , cache_complete(false)
    , input_passes(0)
    , block_index(0)
    , row_index(0) {
    addChild(input);
    if (memory_blocks < 1)
        throw ConfigurationError("Materialize needs at least 1 memory block");
    schema = input->getSchema();
}

void Materialize::discardCache() {
    reader.reset();
    blocks.clear();
    spilled.drop();
    cache_complete = false;
}

void Materialize::fillCache() {
    discardCache();
    input_passes++;
    input->open();
    Row row;
    while (input->next(row)) {
        if (spilled.isValid()) {
            spilled.append(std::move(row));
            continue;
        }
        if (blocks.empty() || blocks.back()->full()) {
            if (blocks.size() >= getMemoryBlocks()) {
                // the cache does not fit, move it to a partition whose write buffer takes the place of the blocks
                spilled = createPartition("cache");
                for (auto& block : blocks)
                    spilled.writeBlock(*block);
                blocks.clear();
                spilled.append(std::move(row));
                continue;
            }
            blocks.push_back(allocateBlock());
        }
        blocks.back()->addRow(std::move(row));
    }
    input->close();
    if (spilled.isValid())
        spilled.finishWriting();
    cache_complete = true;
}

void Materialize::openImpl() {
    if (!cache_complete)
        fillCache();
    block_index = 0;
    row_index = 0;
    if (spilled.isValid())
        reader = spilled.scan();
}

bool Materialize::nextImpl(Row& row) {
    if (reader)
        return reader->next(row);
    while (block_index < blocks.size()) {
        if (row_index < blocks[block_index]->getCurrentSize()) {
            row = blocks[block_index]->getRow(row_index++);
            return true;
        }
        block_index++;
        row_index = 0;
    }
    return false;
}

void Materialize::closeImpl() {
    reader.reset();
    if (!cache_complete)
        discardCache(); // the input failed or was abandoned while the cache was filled
}

void Materialize::describe(std::ostream& out) const {
    out << (isSpilled() ? "spilled" : "in memory") << ", input passes: " << input_passes;
}
