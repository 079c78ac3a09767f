#include "filter.hpp"

#include <stdexcept>

Filter::Filter(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const RowPredicate& predicate)
    : OperatorBase(context, "filter", 0)
    , input(input)
    , predicate(predicate)
    , rows_rejected(0) {
    addChild(input);
    if (!predicate)
        throw std::runtime_error("Filter requires a predicate");
    schema = input->getSchema();
}

void Filter::openImpl() {
    input->open();
}

bool Filter::nextImpl(Row& row) {
    while (input->next(row)) {
        if (predicate(row))
            return true;
        rows_rejected++;
    }
    return false;
}

void Filter::describe(std::ostream& out) const {
    out << "rejected: " << rows_rejected;
}

Limit::Limit(ExecutionContext& context, std::shared_ptr<OperatorBase> input, size_t limit)
    : OperatorBase(context, "limit", 0)
    , input(input)
    , limit(limit)
    , produced(0) {
    addChild(input);
    schema = input->getSchema();
}

void Limit::openImpl() {
    produced = 0;
    if (limit > 0)
        input->open();
}

bool Limit::nextImpl(Row& row) {
    if (produced >= limit || !input->next(row))
        return false;
    produced++;
    return true;
}

void Limit::describe(std::ostream& out) const {
    out << "limit: " << limit;
}
