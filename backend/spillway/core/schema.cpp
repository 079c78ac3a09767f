#include "schema.hpp"

#include <stdexcept>

Schema::Schema(std::vector<ColumnDefinition>&& columns) {
    for (auto& column : columns)
        addColumn(column.name, column.type);
}

void Schema::addColumn(const std::string& name, ValueType type) {
    size_t existing;
    if (tryFind(name, existing))
        throw std::runtime_error("Column name '" + name + "' is not unique");
    columns.emplace_back(name, type);
}

size_t Schema::find(const std::string& column_name) const {
    size_t result;
    if (!tryFind(column_name, result))
        throw std::runtime_error("Column name '" + column_name + "' not found");
    return result;
}

bool Schema::tryFind(const std::string& column_name, size_t& dest) const {
    for (size_t i = 0; i < columns.size(); i++) {
        if (columns[i].name == column_name) {
            dest = i;
            return true;
        }
    }
    return false;
}

std::vector<size_t> Schema::findAll(const std::vector<std::string>& column_names) const {
    std::vector<size_t> result;
    result.reserve(column_names.size());
    for (auto& name : column_names)
        result.push_back(find(name));
    return result;
}

Schema Schema::concat(const Schema& left, const Schema& right) {
    Schema result = left;
    for (auto& column : right.columns)
        result.addColumn(column.name, column.type);
    return result;
}
