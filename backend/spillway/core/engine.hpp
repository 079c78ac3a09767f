#pragma once

#include <cstdint>

#include "config.hpp"
#include "../storage/temp_store.hpp"

class Engine {
public:
    explicit Engine(const ExecutionConfig& config);

    Engine(const Engine& other) = delete;
    Engine& operator=(const Engine& other) = delete;

    uint64_t allocateOperatorId() { return next_operator_id++; }

    const ExecutionConfig config;
    TempStore temp_store;

private:
    uint64_t next_operator_id;
};

// reclaims every temporary partition that is still alive when a statement ends, whether it completed or failed
class StatementScope {
public:
    explicit StatementScope(Engine& engine);
    ~StatementScope();

    StatementScope(const StatementScope& other) = delete;
    StatementScope& operator=(const StatementScope& other) = delete;

    size_t getPartitionsAtStart() const { return partitions_at_start; }

private:
    Engine& engine;
    const size_t partitions_at_start;
};
