#include "types.hpp"

#include <cmath>
#include <cstring>
#include <functional>
#include <iomanip>
#include <stdexcept>

#include "errors.hpp"
#include "../utils/hash.hpp"

#define TEMPORAL_HASH_SEED 0x7d1a2f3b9c4e5d60ull
#define NAN_HASH 0x7ff8000000000000ull

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::Null:
            return "NULL";
        case ValueType::Boolean:
            return "BOOLEAN";
        case ValueType::Integer:
            return "INTEGER";
        case ValueType::Float:
            return "FLOAT";
        case ValueType::Text:
            return "TEXT";
        case ValueType::Date:
            return "DATE";
        case ValueType::DateTime:
            return "DATETIME";
    }
    return "UNKNOWN";
}

static uint32_t parse_digits(const char* str, size_t len) {
    uint32_t result = 0;
    for (size_t i = 0; i < len; i++) {
        const char c = str[i];
        if (c < '0' || c > '9')
            throw std::runtime_error("Invalid character encountered while parsing int!");
        result *= 10;
        result += static_cast<uint32_t>(c - '0');
    }
    return result;
}

uint32_t parse_date(const char* str, size_t len) {
    if (len != 10 || str[4] != '-' || str[7] != '-')
        throw std::runtime_error("Malformed date string!");

    uint32_t year = parse_digits(str, 4);
    uint32_t month = parse_digits(str + 5, 2);
    uint32_t day = parse_digits(str + 8, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31)
        throw std::runtime_error("Date out of range!");

    return encode_date(year, month, day);
}

uint64_t parse_date_time(const char* str, size_t len) {
    if (len != 19 || str[4] != '-' || str[7] != '-' || str[10] != ' ' || str[13] != ':' || str[16] != ':')
        throw std::runtime_error("Malformed datetime string!");

    uint32_t year = parse_digits(str, 4);
    uint32_t month = parse_digits(str + 5, 2);
    uint32_t day = parse_digits(str + 8, 2);
    uint32_t hour = parse_digits(str + 11, 2);
    uint32_t minute = parse_digits(str + 14, 2);
    uint32_t second = parse_digits(str + 17, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59)
        throw std::runtime_error("Datetime out of range!");

    return encode_date_time(year, month, day, hour, minute, second);
}

static bool looksTemporal(const std::string& text) {
    return (text.size() == 10 || text.size() == 19) && text[4] == '-' && text[7] == '-';
}

// maps a date, a datetime or a text in one of the two ISO formats onto the datetime encoding
static uint64_t temporalKey(const Value& value) {
    switch (value.getType()) {
        case ValueType::Date:
            return date_to_date_time(value.getDate());
        case ValueType::DateTime:
            return value.getDateTime();
        case ValueType::Text: {
            const std::string& text = value.getText();
            try {
                if (text.size() == 10)
                    return date_to_date_time(parse_date(text.data(), text.size()));
                return parse_date_time(text.data(), text.size());
            } catch (const std::runtime_error& e) {
                throw TypeMismatchError("Cannot interpret '" + text + "' as a date: " + e.what());
            }
        }
        default:
            throw TypeMismatchError(std::string("Value of type ") + valueTypeName(value.getType()) + " is not temporal");
    }
}

static int sign(int64_t a, int64_t b) {
    return a < b ? -1 : (a > b ? 1 : 0);
}

// 2^63, exactly representable as a double
static const double INT64_BOUND = 9223372036854775808.0;

bool floatToInteger(double value, int64_t& out) {
    if (std::isnan(value) || value < -INT64_BOUND || value >= INT64_BOUND || std::trunc(value) != value)
        return false;
    out = static_cast<int64_t>(value);
    return true;
}

static int compareFloats(double a, double b) {
    if (std::isnan(a) || std::isnan(b))
        return std::isnan(a) ? (std::isnan(b) ? 0 : 1) : -1;
    return a < b ? -1 : (a > b ? 1 : 0);
}

// exact, without rounding the integer to a double
static int compareIntegerWithFloat(int64_t a, double b) {
    if (std::isnan(b) || b >= INT64_BOUND)
        return -1;
    if (b < -INT64_BOUND)
        return 1;
    const double whole = std::trunc(b);
    const int cmp = sign(a, static_cast<int64_t>(whole));
    if (cmp != 0)
        return cmp;
    return b > whole ? -1 : (b < whole ? 1 : 0);
}

Value Value::boolean(bool value) {
    Value result;
    result.type = ValueType::Boolean;
    result.int_value = value ? 1 : 0;
    return result;
}

Value Value::integer(int64_t value) {
    Value result;
    result.type = ValueType::Integer;
    result.int_value = value;
    return result;
}

Value Value::floating(double value) {
    Value result;
    result.type = ValueType::Float;
    result.float_value = value;
    return result;
}

Value Value::text(const std::string& value) {
    Value result;
    result.type = ValueType::Text;
    result.text_value = value;
    return result;
}

Value Value::date(uint32_t encoded) {
    Value result;
    result.type = ValueType::Date;
    result.int_value = encoded;
    return result;
}

Value Value::dateTime(uint64_t encoded) {
    Value result;
    result.type = ValueType::DateTime;
    result.int_value = static_cast<int64_t>(encoded);
    return result;
}

bool Value::getBoolean() const {
    if (type != ValueType::Boolean)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not a BOOLEAN");
    return int_value != 0;
}

int64_t Value::getInteger() const {
    if (type != ValueType::Integer)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not an INTEGER");
    return int_value;
}

double Value::getFloat() const {
    if (type != ValueType::Float)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not a FLOAT");
    return float_value;
}

const std::string& Value::getText() const {
    if (type != ValueType::Text)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not a TEXT");
    return text_value;
}

uint32_t Value::getDate() const {
    if (type != ValueType::Date)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not a DATE");
    return static_cast<uint32_t>(int_value);
}

uint64_t Value::getDateTime() const {
    if (type != ValueType::DateTime)
        throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not a DATETIME");
    return static_cast<uint64_t>(int_value);
}

double Value::asDouble() const {
    switch (type) {
        case ValueType::Boolean:
        case ValueType::Integer:
            return static_cast<double>(int_value);
        case ValueType::Float:
            return float_value;
        default:
            throw TypeMismatchError(std::string("Value of type ") + valueTypeName(type) + " is not numeric");
    }
}

int Value::compare(const Value& other) const {
    if (isNull() || other.isNull())
        return isNull() ? (other.isNull() ? 0 : -1) : 1;

    if (isNumeric() && other.isNumeric()) {
        if (type != ValueType::Float && other.type != ValueType::Float)
            return sign(int_value, other.int_value);
        if (type == ValueType::Float && other.type == ValueType::Float)
            return compareFloats(float_value, other.float_value);
        if (type == ValueType::Float)
            return -compareIntegerWithFloat(other.int_value, float_value);
        return compareIntegerWithFloat(int_value, other.float_value);
    }
    if (type == ValueType::Text && other.type == ValueType::Text) {
        const int cmp = text_value.compare(other.text_value);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    if ((isTemporal() || type == ValueType::Text) && (other.isTemporal() || other.type == ValueType::Text)) {
        const uint64_t a = temporalKey(*this);
        const uint64_t b = temporalKey(other);
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    throw TypeMismatchError(std::string("Cannot compare values of type ") + valueTypeName(type) + " and " + valueTypeName(other.type));
}

uint64_t Value::hash() const {
    switch (type) {
        case ValueType::Null:
            return 0;
        case ValueType::Boolean:
        case ValueType::Integer:
            return scrambleHash(static_cast<uint64_t>(int_value));
        case ValueType::Float: {
            // integral floats must collide with the equal integer, all NaNs with each other
            int64_t integral;
            if (floatToInteger(float_value, integral))
                return scrambleHash(static_cast<uint64_t>(integral));
            if (std::isnan(float_value))
                return scrambleHash(NAN_HASH);
            uint64_t bits;
            std::memcpy(&bits, &float_value, sizeof(bits));
            return scrambleHash(bits);
        }
        case ValueType::Text:
            if (looksTemporal(text_value)) {
                try {
                    return scrambleHash(combineHashes(TEMPORAL_HASH_SEED, temporalKey(*this)));
                } catch (const TypeMismatchError&) {
                    // not a date after all, hash as plain text
                }
            }
            return scrambleHash(std::hash<std::string>()(text_value));
        case ValueType::Date:
        case ValueType::DateTime:
            return scrambleHash(combineHashes(TEMPORAL_HASH_SEED, temporalKey(*this)));
    }
    return 0;
}

bool Value::operator==(const Value& other) const {
    if (type != other.type)
        return false;
    switch (type) {
        case ValueType::Null:
            return true;
        case ValueType::Float:
            return float_value == other.float_value || (std::isnan(float_value) && std::isnan(other.float_value));
        case ValueType::Text:
            return text_value == other.text_value;
        default:
            return int_value == other.int_value;
    }
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.type) {
        case ValueType::Null:
            return os << "NULL";
        case ValueType::Boolean:
            return os << (value.int_value != 0 ? "true" : "false");
        case ValueType::Integer:
            return os << value.int_value;
        case ValueType::Float:
            return os << value.float_value;
        case ValueType::Text:
            return os << value.text_value;
        case ValueType::Date: {
            const uint32_t date = static_cast<uint32_t>(value.int_value);
            return os << std::setw(4) << std::setfill('0') << (date >> 9) << "-"
                      << std::setw(2) << ((date >> 5) & 0b1111) << "-"
                      << std::setw(2) << (date & 0b11111) << std::setfill(' ');
        }
        case ValueType::DateTime: {
            const uint64_t date_time = static_cast<uint64_t>(value.int_value);
            const uint32_t second = date_time & 0x1ffff;
            return os << std::setw(4) << std::setfill('0') << (date_time >> 26) << "-"
                      << std::setw(2) << ((date_time >> 22) & 0b1111) << "-"
                      << std::setw(2) << ((date_time >> 17) & 0b11111) << " "
                      << std::setw(2) << second / 3600 << ":"
                      << std::setw(2) << (second / 60) % 60 << ":"
                      << std::setw(2) << second % 60 << std::setfill(' ');
        }
    }
    return os;
}
