#include "aggregate_state.hpp"

#include <cmath>
#include <stdexcept>

#include "../core/errors.hpp"

const char* aggregateFunctionName(AggregateFunction function) {
    switch (function) {
        case AggregateFunction::CountStar:
            return "count(*)";
        case AggregateFunction::Count:
            return "count";
        case AggregateFunction::Sum:
            return "sum";
        case AggregateFunction::Avg:
            return "avg";
        case AggregateFunction::Min:
            return "min";
        case AggregateFunction::Max:
            return "max";
        case AggregateFunction::StddevPop:
            return "stddev_pop";
    }
    return "unknown";
}

std::unique_ptr<AggregateState> createAggregateState(AggregateFunction function) {
    switch (function) {
        case AggregateFunction::CountStar:
        case AggregateFunction::Count:
            return std::make_unique<CountState>();
        case AggregateFunction::Sum:
            return std::make_unique<SumState>();
        case AggregateFunction::Avg:
            return std::make_unique<AvgState>();
        case AggregateFunction::Min:
            return std::make_unique<MinMaxState>(true);
        case AggregateFunction::Max:
            return std::make_unique<MinMaxState>(false);
        case AggregateFunction::StddevPop:
            return std::make_unique<StddevPopState>();
    }
    throw std::runtime_error("Unknown aggregate function");
}

void SumState::addInteger(int64_t value) {
    int64_t result;
    if (__builtin_add_overflow(int_sum, value, &result)) {
        // the exact sum no longer fits, continue with the float sum
        float_sum += static_cast<double>(int_sum) + static_cast<double>(value);
        int_sum = 0;
        has_float = true;
        return;
    }
    int_sum = result;
}

void SumState::update(const Value& value) {
    switch (value.getType()) {
        case ValueType::Boolean:
            addInteger(value.getBoolean() ? 1 : 0);
            break;
        case ValueType::Integer:
            addInteger(value.getInteger());
            break;
        case ValueType::Float:
            float_sum += value.getFloat();
            has_float = true;
            break;
        default:
            throw TypeMismatchError(std::string("sum() cannot add values of type ") + valueTypeName(value.getType()));
    }
    has_value = true;
}

Value SumState::finalize() const {
    if (!has_value)
        return Value::null();
    if (has_float)
        return Value::floating(float_sum + static_cast<double>(int_sum));
    return Value::integer(int_sum);
}

void AvgState::update(const Value& value) {
    sum += value.asDouble();
    count++;
}

Value AvgState::finalize() const {
    if (count == 0)
        return Value::null();
    return Value::floating(sum / static_cast<double>(count));
}

void MinMaxState::update(const Value& value) {
    if (!has_value) {
        best = value;
        has_value = true;
        return;
    }
    const int cmp = value.compare(best);
    if ((minimum && cmp < 0) || (!minimum && cmp > 0))
        best = value;
}

Value MinMaxState::finalize() const {
    return has_value ? best : Value::null();
}

void StddevPopState::update(const Value& value) {
    const double x = value.asDouble();
    count++;
    const double delta = x - mean;
    mean += delta / static_cast<double>(count);
    m2 += delta * (x - mean);
}

Value StddevPopState::finalize() const {
    if (count == 0)
        return Value::null();
    return Value::floating(std::sqrt(m2 / static_cast<double>(count)));
}
