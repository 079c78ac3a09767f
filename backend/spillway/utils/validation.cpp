#include "validation.hpp"

#include "../execution/operator.hpp"

std::vector<Row> collectRows(OperatorBase& op) {
    std::vector<Row> rows;
    op.open();
    Row row;
    while (op.next(row))
        rows.push_back(row);
    op.close();
    return rows;
}

bool validateQueryResult(const std::vector<Row>& result, const std::vector<Row>& expected, const Schema& schema, bool match_order) {
    for (auto& row : result) {
        if (row.size() != schema.size()) {
            std::cout << "Result row " << row << " does not match the " << schema.size() << " result columns" << std::endl;
            return false;
        }
    }

    // check that tuples match
    bool match = true;
    std::vector<bool> matched(expected.size(), false);
    if (match_order) {
        for (size_t row_id = 0; row_id < result.size(); row_id++) {
            if (row_id >= expected.size()) {
                std::cout << "Result set contains more rows than expected" << std::endl;
                std::cout << "Full result:" << std::endl;
                printQueryResult(result, schema);
                return false;
            }
            if (result[row_id] != expected[row_id]) {
                std::cout << "Did not find match for result set row " << row_id + 1 << ":" << std::endl;
                printResultRow(result[row_id]);
                std::cout << "Full result:" << std::endl;
                printQueryResult(result, schema);
                return false;
            }
            matched[row_id] = true;
        }
    } else {
        for (size_t row_id = 0; row_id < result.size(); row_id++) {
            bool found_match = false;
            for (size_t ex_row_id = 0; ex_row_id < expected.size(); ex_row_id++) {
                if (!matched[ex_row_id] && result[row_id] == expected[ex_row_id]) {
                    matched[ex_row_id] = true;
                    found_match = true;
                    break;
                }
            }
            if (!found_match) {
                std::cout << "Did not find match for result set row " << row_id + 1 << ":" << std::endl;
                printResultRow(result[row_id]);
                std::cout << "Full result:" << std::endl;
                printQueryResult(result, schema);
                match = false;
            }
        }
    }

    size_t missing_expected_rows = 0;
    for (bool m : matched)
        missing_expected_rows += m ? 0 : 1;
    if (missing_expected_rows > 0) {
        std::cout << missing_expected_rows << " expected rows are missing from the result set:" << std::endl;
        match = false;
        for (size_t ex_row_id = 0; ex_row_id < expected.size(); ex_row_id++) {
            if (!matched[ex_row_id])
                printResultRow(expected[ex_row_id]);
        }
    }

    return match;
}

bool validateQueryResult(OperatorBase& op, const std::vector<Row>& expected, bool match_order) {
    return validateQueryResult(collectRows(op), expected, op.getSchema(), match_order);
}
