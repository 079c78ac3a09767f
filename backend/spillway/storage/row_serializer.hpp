#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/row.hpp"

// on-disk layout of a block inside a partition file: header followed by 'payload_size' bytes of serialized rows
struct BlockRecordHeader {
    uint32_t magic;
    uint32_t row_count;
    uint64_t payload_size;
};

#define BLOCK_RECORD_MAGIC 0x53504c42u

// value layout: one tag byte (ValueType), followed by
// boolean: 1 byte, integer/float/datetime: 8 bytes, date: 4 bytes, text: 4 byte length + characters
void serializeValue(const Value& value, std::string& out);
void serializeRow(const Row& row, std::string& out);
// advances 'pos'; throws ResourceError if the buffer ends early or contains an unknown tag
Value deserializeValue(const char*& pos, const char* end);
Row deserializeRow(const char*& pos, const char* end);

// encodes the values of 'columns' so that values which are equal after coercion produce identical bytes;
// used to identify groups
void encodeGroupKey(const Row& row, const std::vector<size_t>& columns, std::string& out);
