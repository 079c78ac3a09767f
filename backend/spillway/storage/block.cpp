#include "block.hpp"

#include <stdexcept>

Block::Block(MemoryBudget& budget, size_t capacity)
    : budget(budget)
    , capacity(capacity) {
    if (capacity == 0)
        throw std::runtime_error("Block capacity must be positive");
    rows.reserve(capacity);
    budget.allocateBlock();
}

Block::~Block() {
    budget.dropBlock();
}
