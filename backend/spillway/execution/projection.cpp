#include "projection.hpp"

#include <stdexcept>

#include "key.hpp"

Projection::Projection(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<size_t>& columns, const std::vector<std::string>& names)
    : OperatorBase(context, "projection", 0)
    , input(input)
    , columns(columns) {
    addChild(input);
    if (!names.empty() && names.size() != columns.size())
        throw std::runtime_error("Projection has " + std::to_string(columns.size()) + " columns but " + std::to_string(names.size()) + " names");
    checkKeyColumns(input->getSchema(), columns, "Projected");
    for (size_t i = 0; i < columns.size(); i++) {
        const ColumnDefinition& column = input->getSchema().getColumns()[columns[i]];
        schema.addColumn(names.empty() ? column.name : names[i], column.type);
    }
}

void Projection::openImpl() {
    input->open();
}

bool Projection::nextImpl(Row& row) {
    if (!input->next(input_row))
        return false;
    row.clear();
    row.reserve(columns.size());
    for (size_t column : columns)
        row.push_back(input_row[column]);
    return true;
}
