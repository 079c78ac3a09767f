#pragma once

#include <memory>
#include <vector>

#include "operator.hpp"

// Equi-join of two inputs ordered by their join keys. Inputs that are not already ordered ('left_sorted' and
// 'right_sorted' are false) are first sorted into a single run each. The merge buffers the left rows of one key
// group in at most 'memory_blocks - 2' blocks; a larger group raises a ConfigurationError.
// The output is ordered by the join key.
class SortMergeJoin : public OperatorBase {
public:
    SortMergeJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> left, std::shared_ptr<OperatorBase> right, const std::vector<size_t>& left_key, const std::vector<size_t>& right_key, size_t memory_blocks, bool left_sorted = false, bool right_sorted = false);

    size_t getInitialRunCount() const { return initial_runs; }
    size_t getMergePassCount() const { return merge_passes; }
    size_t getLargestGroupBlocks() const { return largest_group_blocks; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    // one side of the merge, skipping rows with a null key
    struct Cursor {
        RowSource* source = nullptr;
        const std::vector<size_t>* key = nullptr;
        Row current;
        bool valid = false;

        void advance();
    };

    Partition sortInput(OperatorBase& input, const std::vector<size_t>& key, const std::string& side);
    void bufferLeftGroup();
    const Row& getGroupRow(size_t row_id) const;

    const std::shared_ptr<OperatorBase> left;
    const std::shared_ptr<OperatorBase> right;
    const std::vector<size_t> left_key;
    const std::vector<size_t> right_key;
    const bool left_sorted;
    const bool right_sorted;
    const size_t max_group_blocks;

    Partition left_run;
    Partition right_run;
    std::unique_ptr<PartitionReader> left_reader;
    std::unique_ptr<PartitionReader> right_reader;
    Cursor left_cursor;
    Cursor right_cursor;

    std::vector<std::unique_ptr<Block>> group;
    size_t group_rows;
    size_t group_position;
    bool emitting;

    size_t initial_runs;
    size_t merge_passes;
    size_t largest_group_blocks;
};
