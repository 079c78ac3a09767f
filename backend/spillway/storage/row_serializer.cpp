#include "row_serializer.hpp"

#include <cmath>
#include <cstring>
#include <limits>

#include "../core/errors.hpp"

template <typename T>
static void appendRaw(std::string& out, T value) {
    out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
static T readRaw(const char*& pos, const char* end) {
    if (static_cast<size_t>(end - pos) < sizeof(T))
        throw ResourceError("Corrupted partition record: unexpected end of data");
    T value;
    std::memcpy(&value, pos, sizeof(T));
    pos += sizeof(T);
    return value;
}

void serializeValue(const Value& value, std::string& out) {
    out.push_back(static_cast<char>(value.getType()));
    switch (value.getType()) {
        case ValueType::Null:
            break;
        case ValueType::Boolean:
            out.push_back(value.getBoolean() ? 1 : 0);
            break;
        case ValueType::Integer:
            appendRaw<int64_t>(out, value.getInteger());
            break;
        case ValueType::Float:
            appendRaw<double>(out, value.getFloat());
            break;
        case ValueType::Text: {
            const std::string& text = value.getText();
            appendRaw<uint32_t>(out, static_cast<uint32_t>(text.size()));
            out.append(text);
            break;
        }
        case ValueType::Date:
            appendRaw<uint32_t>(out, value.getDate());
            break;
        case ValueType::DateTime:
            appendRaw<uint64_t>(out, value.getDateTime());
            break;
    }
}

void serializeRow(const Row& row, std::string& out) {
    appendRaw<uint32_t>(out, static_cast<uint32_t>(row.size()));
    for (auto& value : row)
        serializeValue(value, out);
}

Value deserializeValue(const char*& pos, const char* end) {
    const uint8_t tag = readRaw<uint8_t>(pos, end);
    switch (static_cast<ValueType>(tag)) {
        case ValueType::Null:
            return Value::null();
        case ValueType::Boolean:
            return Value::boolean(readRaw<uint8_t>(pos, end) != 0);
        case ValueType::Integer:
            return Value::integer(readRaw<int64_t>(pos, end));
        case ValueType::Float:
            return Value::floating(readRaw<double>(pos, end));
        case ValueType::Text: {
            const uint32_t length = readRaw<uint32_t>(pos, end);
            if (static_cast<size_t>(end - pos) < length)
                throw ResourceError("Corrupted partition record: text exceeds record");
            Value result = Value::text(std::string(pos, length));
            pos += length;
            return result;
        }
        case ValueType::Date:
            return Value::date(readRaw<uint32_t>(pos, end));
        case ValueType::DateTime:
            return Value::dateTime(readRaw<uint64_t>(pos, end));
    }
    throw ResourceError("Corrupted partition record: unknown value tag " + std::to_string(tag));
}

Row deserializeRow(const char*& pos, const char* end) {
    const uint32_t arity = readRaw<uint32_t>(pos, end);
    Row row;
    row.reserve(arity);
    for (uint32_t i = 0; i < arity; i++)
        row.push_back(deserializeValue(pos, end));
    return row;
}

void encodeGroupKey(const Row& row, const std::vector<size_t>& columns, std::string& out) {
    for (size_t column : columns) {
        const Value& value = row.at(column);
        switch (value.getType()) {
            case ValueType::Boolean:
            case ValueType::Integer:
                out.push_back(static_cast<char>(ValueType::Integer));
                appendRaw<int64_t>(out, value.getType() == ValueType::Boolean ? (value.getBoolean() ? 1 : 0) : value.getInteger());
                break;
            case ValueType::Float: {
                const double f = value.getFloat();
                int64_t integral;
                if (floatToInteger(f, integral)) {
                    out.push_back(static_cast<char>(ValueType::Integer));
                    appendRaw<int64_t>(out, integral);
                } else if (std::isnan(f)) {
                    out.push_back(static_cast<char>(ValueType::Float));
                    appendRaw<double>(out, std::numeric_limits<double>::quiet_NaN());
                } else {
                    out.push_back(static_cast<char>(ValueType::Float));
                    appendRaw<double>(out, f);
                }
                break;
            }
            case ValueType::Date:
                out.push_back(static_cast<char>(ValueType::DateTime));
                appendRaw<uint64_t>(out, date_to_date_time(value.getDate()));
                break;
            default:
                serializeValue(value, out);
                break;
        }
    }
}
