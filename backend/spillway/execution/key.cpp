#include "key.hpp"

#include <stdexcept>

#include "../core/errors.hpp"
#include "../utils/hash.hpp"

int compareKeys(const Row& left, const std::vector<size_t>& left_key, const Row& right, const std::vector<size_t>& right_key) {
    for (size_t i = 0; i < left_key.size(); i++) {
        const int cmp = left[left_key[i]].compare(right[right_key[i]]);
        if (cmp != 0)
            return cmp;
    }
    return 0;
}

bool keysEqual(const Row& left, const std::vector<size_t>& left_key, const Row& right, const std::vector<size_t>& right_key) {
    for (size_t i = 0; i < left_key.size(); i++) {
        if (!left[left_key[i]].equals(right[right_key[i]]))
            return false;
    }
    return true;
}

bool hasNullKey(const Row& row, const std::vector<size_t>& key) {
    for (size_t column : key) {
        if (row[column].isNull())
            return true;
    }
    return false;
}

uint64_t hashKey(const Row& row, const std::vector<size_t>& key) {
    uint64_t hash = 0;
    for (size_t column : key)
        hash = combineHashes(hash, row[column].hash());
    return scrambleHash(hash);
}

Row projectRow(const Row& row, const std::vector<size_t>& columns) {
    Row result;
    result.reserve(columns.size());
    for (size_t column : columns)
        result.push_back(row[column]);
    return result;
}

void checkKeyColumns(const Schema& schema, const std::vector<size_t>& key, const std::string& what) {
    for (size_t column : key) {
        if (column >= schema.size())
            throw std::runtime_error(what + " column " + std::to_string(column) + " is out of range for " + std::to_string(schema.size()) + " input columns");
    }
}

void checkJoinKeys(const std::vector<size_t>& left_key, const std::vector<size_t>& right_key) {
    if (left_key.empty() || left_key.size() != right_key.size())
        throw ConfigurationError("Join keys must be non-empty and of equal length");
}

JoinPredicate makeEquiJoinPredicate(const std::vector<size_t>& left_key, const std::vector<size_t>& right_key) {
    return [=](const Row& left, const Row& right) -> bool {
        return keysEqual(left, left_key, right, right_key);
    };
}
