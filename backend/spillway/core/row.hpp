#pragma once

#include <functional>
#include <iostream>
#include <vector>

#include "types.hpp"

typedef std::vector<Value> Row;
typedef std::function<bool(const Row&)> RowPredicate;

// a single-pass stream of rows, implemented by operators and by readers of temporary partitions
class RowSource {
public:
    virtual ~RowSource() { }

    // moves the next row into 'row', returns false once the stream is exhausted
    virtual bool next(Row& row) = 0;
};

Row concatRows(const Row& left, const Row& right);

std::ostream& operator<<(std::ostream& os, const Row& row);
