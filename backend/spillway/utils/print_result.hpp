#pragma once

#include <iostream>
#include <vector>

#include "../core/row.hpp"
#include "../core/schema.hpp"

class OperatorBase;

void printResultRow(const Row& row, std::ostream& out = std::cout);
void printQueryResult(const std::vector<Row>& rows, const Schema& schema, std::ostream& out = std::cout);
// prints the operator tree below 'root' with the statistics of each operator
void printOperatorStats(const OperatorBase& root, std::ostream& out = std::cout);
