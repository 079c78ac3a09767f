#pragma once

#include <vector>

#include "print_result.hpp"

class OperatorBase;

// helper utilities for validating result sets in testing

// opens 'op', drains it and closes it again
std::vector<Row> collectRows(OperatorBase& op);

// compares rows by exact value equality; without 'match_order' the rows are compared as multisets
bool validateQueryResult(const std::vector<Row>& result, const std::vector<Row>& expected, const Schema& schema, bool match_order = false);
bool validateQueryResult(OperatorBase& op, const std::vector<Row>& expected, bool match_order = false);
