#pragma once

#include <cstddef>
#include <string>

// number of rows per block, the unit of temporary I/O and of memory accounting
#define DEFAULT_BLOCK_CAPACITY 64ul
// number of blocks an operator may keep resident unless its constructor is given a different budget
#define DEFAULT_NUM_MEMORY_BLOCKS 10ul
// hash join falls back to a nested-loop probe for bucket pairs that are still too large at this depth
#define DEFAULT_HASH_MAX_DEPTH 8ul
#define DEFAULT_TEMP_DIRECTORY "spillway.tmp"
// partition files beyond this number are closed and reopened on their next access
#define DEFAULT_MAX_OPEN_FILES 64ul

struct ExecutionConfig {
    size_t block_capacity = DEFAULT_BLOCK_CAPACITY;
    size_t num_memory_blocks = DEFAULT_NUM_MEMORY_BLOCKS;
    size_t hash_max_depth = DEFAULT_HASH_MAX_DEPTH;
    std::string temp_directory = DEFAULT_TEMP_DIRECTORY;
    size_t max_open_files = DEFAULT_MAX_OPEN_FILES;
    bool verbose = false;

    ExecutionConfig() { }
    ExecutionConfig(size_t block_capacity, size_t num_memory_blocks, const std::string& temp_directory, bool verbose = false)
        : block_capacity(block_capacity)
        , num_memory_blocks(num_memory_blocks)
        , temp_directory(temp_directory)
        , verbose(verbose) { }
};
