#include "print_result.hpp"

#include <iomanip>
#include <sstream>

#include "../execution/operator.hpp"

void printResultRow(const Row& row, std::ostream& out) {
    out << "| ";
    for (auto& value : row) {
        std::stringstream str;
        str << value;
        out << std::setw(20) << std::setfill(' ') << str.str().substr(0, 20) << " | ";
    }
    out << std::endl;
}

void printQueryResult(const std::vector<Row>& rows, const Schema& schema, std::ostream& out) {
    int64_t row_limit = 10;
    out << "| ";
    for (auto& column : schema.getColumns()) {
        out << std::setw(20) << std::setfill(' ') << column.name << " | ";
    }
    out << std::endl << "| ";
    for (size_t i = 0; i < schema.size(); i++) {
        out << std::setw(23) << std::setfill('-') << " | ";
    }
    out << std::endl;
    for (auto& row : rows) {
        if (row_limit > 0)
            printResultRow(row, out);
        row_limit--;
    }
    if (row_limit < 0)
        out << "| " << -row_limit << " additional rows ..." << std::endl;
}

namespace {

void printOperatorStats(const OperatorBase& op, size_t level, std::ostream& out) {
    const OperatorStats& stats = op.getStats();
    const MemoryBudget& budget = op.getMemoryBudget();
    out << std::string(level * 2, ' ') << op.getName() << " [";
    op.describe(out);
    out << "] opens: " << stats.opens << ", rows: " << stats.rows_produced << ", blocks read/written: " << stats.io.blocks_read << "/"
        << stats.io.blocks_written << ", memory peak: " << budget.getPeakBlocksInUse() << "/" << budget.getMaxBlocks() << std::endl;
    for (auto& child : op.getChildren())
        printOperatorStats(*child, level + 1, out);
}

}

void printOperatorStats(const OperatorBase& root, std::ostream& out) {
    printOperatorStats(root, 0, out);
}
