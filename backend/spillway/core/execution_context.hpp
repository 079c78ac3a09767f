#pragma once

#include "engine.hpp"

class ExecutionContext {
public:
    explicit ExecutionContext(Engine& engine) : engine(engine) { }

    Engine& getEngine() const { return engine; }
    const ExecutionConfig& getConfig() const { return engine.config; }
    TempStore& getTempStore() const { return engine.temp_store; }
    size_t getBlockCapacity() const { return engine.config.block_capacity; }
    size_t getDefaultMemoryBlocks() const { return engine.config.num_memory_blocks; }
    bool isVerbose() const { return engine.config.verbose; }

private:
    Engine& engine;
};
