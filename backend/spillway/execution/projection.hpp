#pragma once

#include <memory>
#include <string>
#include <vector>

#include "operator.hpp"

// selects and reorders input columns; 'names' renames the output columns, the input names are kept if it is empty
class Projection : public OperatorBase {
public:
    Projection(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<size_t>& columns, const std::vector<std::string>& names = {});

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override { }

private:
    const std::shared_ptr<OperatorBase> input;
    const std::vector<size_t> columns;
    Row input_row;
};
