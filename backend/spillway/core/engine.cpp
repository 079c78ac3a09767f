#include "engine.hpp"

#include <iostream>

#include "errors.hpp"

static const ExecutionConfig& validateConfig(const ExecutionConfig& config) {
    if (config.block_capacity == 0)
        throw ConfigurationError("Block capacity must be at least one row");
    if (config.num_memory_blocks < 3)
        throw ConfigurationError("At least 3 memory blocks are required, configured: " + std::to_string(config.num_memory_blocks));
    if (config.max_open_files == 0)
        throw ConfigurationError("At least one partition file must be allowed to stay open");
    if (config.temp_directory.empty())
        throw ConfigurationError("No temporary directory configured");
    return config;
}

Engine::Engine(const ExecutionConfig& config)
    : config(validateConfig(config))
    , temp_store(config.temp_directory, config.max_open_files, config.verbose)
    , next_operator_id(0) {
    if (config.verbose) {
        std::cout << "[engine] " << "Block capacity: " << config.block_capacity << " rows" << std::endl;
        std::cout << "[engine] " << "Default memory budget: " << config.num_memory_blocks << " blocks per operator" << std::endl;
    }
}

StatementScope::StatementScope(Engine& engine)
    : engine(engine)
    , partitions_at_start(engine.temp_store.getLivePartitionCount()) {
    if (partitions_at_start > 0)
        std::cout << "[engine] " << "Warning: " << partitions_at_start << " partitions are alive at the start of a statement" << std::endl;
}

StatementScope::~StatementScope() {
    const size_t reclaimed = engine.temp_store.reclaimAll();
    if (reclaimed > 0 && engine.config.verbose)
        std::cout << "[engine] " << "Reclaimed " << reclaimed << " partitions at the end of the statement" << std::endl;
}
