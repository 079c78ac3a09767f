#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../core/row.hpp"
#include "../core/schema.hpp"

typedef std::function<bool(const Row& left, const Row& right)> JoinPredicate;

// compares the 'left_key' columns of 'left' with the 'right_key' columns of 'right' position by position;
// null orders first, incomparable values throw TypeMismatchError
int compareKeys(const Row& left, const std::vector<size_t>& left_key, const Row& right, const std::vector<size_t>& right_key);
// SQL equality, a null key component never matches
bool keysEqual(const Row& left, const std::vector<size_t>& left_key, const Row& right, const std::vector<size_t>& right_key);
bool hasNullKey(const Row& row, const std::vector<size_t>& key);
// equal keys (after coercion) produce equal hashes
uint64_t hashKey(const Row& row, const std::vector<size_t>& key);
Row projectRow(const Row& row, const std::vector<size_t>& columns);

// throws if a key column is out of range for 'schema'
void checkKeyColumns(const Schema& schema, const std::vector<size_t>& key, const std::string& what);
// throws ConfigurationError unless both keys are non-empty and of the same length
void checkJoinKeys(const std::vector<size_t>& left_key, const std::vector<size_t>& right_key);

JoinPredicate makeEquiJoinPredicate(const std::vector<size_t>& left_key, const std::vector<size_t>& right_key);
