#include "memory_budget.hpp"

#include <cassert>
#include <iostream>

MemoryBudget::MemoryBudget(size_t max_blocks, const std::string& owner)
    : max_blocks(max_blocks)
    , owner(owner)
    , blocks_in_use(0)
    , peak_blocks_in_use(0)
    , violations(0) { }

void MemoryBudget::allocateBlock() {
    blocks_in_use++;
    if (blocks_in_use > peak_blocks_in_use)
        peak_blocks_in_use = blocks_in_use;
    if (blocks_in_use > max_blocks) {
        if (violations == 0)
            std::cerr << "[budget] " << "Warning: " << owner << " holds " << blocks_in_use << " blocks, its budget is " << max_blocks << " blocks" << std::endl;
        violations++;
    }
}

void MemoryBudget::dropBlock() {
    assert(blocks_in_use > 0);
    blocks_in_use--;
}
