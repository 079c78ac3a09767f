#pragma once

#include <memory>

#include "operator.hpp"

class Filter : public OperatorBase {
public:
    Filter(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const RowPredicate& predicate);

    size_t getRowsRejected() const { return rows_rejected; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override { }

private:
    const std::shared_ptr<OperatorBase> input;
    const RowPredicate predicate;
    size_t rows_rejected;
};

// produces at most 'limit' rows; reaching the limit ends the sequence and closes the input early
class Limit : public OperatorBase {
public:
    Limit(ExecutionContext& context, std::shared_ptr<OperatorBase> input, size_t limit);

    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override { }

private:
    const std::shared_ptr<OperatorBase> input;
    const size_t limit;
    size_t produced;
};
