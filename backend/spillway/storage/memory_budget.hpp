#pragma once

#include <cstddef>
#include <string>

// tracks the number of blocks an operator keeps resident; exceeding the limit is a bug in the operator,
// so it is counted and reported instead of failing the query
class MemoryBudget {
public:
    MemoryBudget(size_t max_blocks, const std::string& owner);

    MemoryBudget(const MemoryBudget& other) = delete;
    MemoryBudget(MemoryBudget&& other) = delete;
    MemoryBudget& operator=(const MemoryBudget& other) = delete;
    MemoryBudget& operator=(MemoryBudget&& other) = delete;

    void allocateBlock();
    void dropBlock();

    size_t getMaxBlocks() const { return max_blocks; }
    size_t getBlocksInUse() const { return blocks_in_use; }
    size_t getPeakBlocksInUse() const { return peak_blocks_in_use; }
    size_t getViolationCount() const { return violations; }
    const std::string& getOwner() const { return owner; }

private:
    const size_t max_blocks;
    const std::string owner;
    size_t blocks_in_use;
    size_t peak_blocks_in_use;
    size_t violations;
};
