#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

enum class ValueType : uint8_t {
    Null = 0,
    Boolean = 1,
    Integer = 2,
    Float = 3,
    Text = 4,
    Date = 5,
    DateTime = 6
};

const char* valueTypeName(ValueType type);

// uint32_t date encoding (starting from LSB):
// bit 0-4: day
// bit 5-8: month
// remaining bits: year

inline uint32_t encode_date(uint32_t year, uint32_t month, uint32_t day) {
    return day | (month << 5) | (year << 9);
}

// uint64_t datetime encoding (starting from LSB):
// bit 0-16: second of day
// bit 17-21: day
// bit 22-25: month
// remaining bits: year

inline uint64_t encode_date_time(uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second) {
    return static_cast<uint64_t>((second + minute * 60 + hour * 3600) | (day << 17) | (month << 22)) | (static_cast<uint64_t>(year) << 26);
}

// both encodings are monotonic, so comparing a date with a datetime only requires moving the date to midnight
inline uint64_t date_to_date_time(uint32_t date) {
    return encode_date_time(date >> 9, (date >> 5) & 0b1111, date & 0b11111, 0, 0, 0);
}

// parses a date in ISO 8601 format (YYYY-MM-DD)
uint32_t parse_date(const char* str, size_t len);
// parses a datetime in the format YYYY-MM-DD HH:MM:SS
uint64_t parse_date_time(const char* str, size_t len);

// stores the integer an integral float represents exactly; false for fractions, NaN and values outside int64_t
bool floatToInteger(double value, int64_t& out);

class Value {
public:
    Value() : type(ValueType::Null), int_value(0), float_value(0.0) { }

    static Value null() { return Value(); }
    static Value boolean(bool value);
    static Value integer(int64_t value);
    static Value floating(double value);
    static Value text(const std::string& value);
    static Value date(uint32_t encoded);
    static Value dateTime(uint64_t encoded);

    ValueType getType() const { return type; }
    bool isNull() const { return type == ValueType::Null; }
    bool isNumeric() const { return type == ValueType::Boolean || type == ValueType::Integer || type == ValueType::Float; }
    bool isTemporal() const { return type == ValueType::Date || type == ValueType::DateTime; }

    bool getBoolean() const;
    int64_t getInteger() const;
    double getFloat() const;
    const std::string& getText() const;
    uint32_t getDate() const;
    uint64_t getDateTime() const;

    // numeric value of a boolean, integer or float
    double asDouble() const;

    // three-way comparison after implicit coercion; null orders before everything else, NaN equals NaN and orders
    // after every other number, integers and floats are compared exactly; throws TypeMismatchError for
    // incomparable types
    int compare(const Value& other) const;
    // SQL equality: null is never equal to anything
    bool equals(const Value& other) const { return !isNull() && !other.isNull() && compare(other) == 0; }
    // consistent with equals(), i.e. equal values after coercion share the same hash
    uint64_t hash() const;

    // exact equality of type and payload
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    friend std::ostream& operator<<(std::ostream& os, const Value& value);

private:
    ValueType type;
    int64_t int_value; // boolean, integer, date and datetime payload
    double float_value;
    std::string text_value;
};
