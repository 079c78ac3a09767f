#include "row.hpp"

Row concatRows(const Row& left, const Row& right) {
    Row result;
    result.reserve(left.size() + right.size());
    result.insert(result.end(), left.begin(), left.end());
    result.insert(result.end(), right.begin(), right.end());
    return result;
}

std::ostream& operator<<(std::ostream& os, const Row& row) {
    os << "(";
    for (size_t i = 0; i < row.size(); i++) {
        if (i > 0)
            os << ", ";
        os << row[i];
    }
    return os << ")";
}
