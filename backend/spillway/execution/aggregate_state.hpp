#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "../core/types.hpp"

enum class AggregateFunction {
    CountStar,
    Count,
    Sum,
    Avg,
    Min,
    Max,
    StddevPop
};

const char* aggregateFunctionName(AggregateFunction function);

// accumulator of one aggregate for one group; receives non-null values only, COUNT(*) receives one value per row
class AggregateState {
public:
    virtual ~AggregateState() { }

    virtual void update(const Value& value) = 0;
    virtual Value finalize() const = 0;
};

std::unique_ptr<AggregateState> createAggregateState(AggregateFunction function);

class CountState : public AggregateState {
public:
    void update(const Value&) override { count++; }
    Value finalize() const override { return Value::integer(count); }

private:
    int64_t count = 0;
};

// integer while all inputs are integral, float once a float was added
// integer while all inputs are integers; a float input or an integer overflow turns the sum into a float
class SumState : public AggregateState {
public:
    void update(const Value& value) override;
    Value finalize() const override;

private:
    void addInteger(int64_t value);

    int64_t int_sum = 0;
    double float_sum = 0.0;
    bool has_float = false;
    bool has_value = false;
};

class AvgState : public AggregateState {
public:
    void update(const Value& value) override;
    Value finalize() const override;

private:
    double sum = 0.0;
    int64_t count = 0;
};

class MinMaxState : public AggregateState {
public:
    explicit MinMaxState(bool minimum) : minimum(minimum), has_value(false) { }

    void update(const Value& value) override;
    Value finalize() const override;

private:
    const bool minimum;
    bool has_value;
    Value best;
};

// population standard deviation, accumulated with Welford's algorithm
class StddevPopState : public AggregateState {
public:
    void update(const Value& value) override;
    Value finalize() const override;

private:
    int64_t count = 0;
    double mean = 0.0;
    double m2 = 0.0;
};
