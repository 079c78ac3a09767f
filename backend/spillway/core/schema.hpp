#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct ColumnDefinition {
    std::string name;
    ValueType type;

    ColumnDefinition(const std::string& name, ValueType type) : name(name), type(type) { }

    bool operator==(const ColumnDefinition& other) const {
        return name == other.name && type == other.type;
    }
};

class Schema {
private:
    std::vector<ColumnDefinition> columns;

public:
    Schema() { }
    Schema(std::vector<ColumnDefinition>&& columns);

    // adds a new column and ensures that the name is unique
    void addColumn(const std::string& name, ValueType type);

    const std::vector<ColumnDefinition>& getColumns() const { return columns; }
    size_t size() const { return columns.size(); }
    size_t find(const std::string& column_name) const;
    bool tryFind(const std::string& column_name, size_t& dest) const;
    std::vector<size_t> findAll(const std::vector<std::string>& column_names) const;

    // schema of a joined row: all columns of 'left', followed by all columns of 'right'
    static Schema concat(const Schema& left, const Schema& right);
};
