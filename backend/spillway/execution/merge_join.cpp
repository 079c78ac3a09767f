#include "merge_join.hpp"

#include "key.hpp"
#include "sort.hpp"
#include "../core/errors.hpp"

void SortMergeJoin::Cursor::advance() {
    while (source->next(current)) {
        if (!hasNullKey(current, *key)) {
            valid = true;
            return;
        }
    }
    valid = false;
}

SortMergeJoin::SortMergeJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> left, std::shared_ptr<OperatorBase> right, const std::vector<size_t>& left_key, const std::vector<size_t>& right_key, size_t memory_blocks, bool left_sorted, bool right_sorted)
    : OperatorBase(context, "merge_join", memory_blocks)
    , left(left)
    , right(right)
    , left_key(left_key)
    , right_key(right_key)
    , left_sorted(left_sorted)
    , right_sorted(right_sorted)
    , max_group_blocks(memory_blocks >= 2 ? memory_blocks - 2 : 0)
    , group_rows(0)
    , group_position(0)
    , emitting(false)
    , initial_runs(0)
    , merge_passes(0)
    , largest_group_blocks(0) {
    addChild(left);
    addChild(right);
    if (memory_blocks < 3)
        throw ConfigurationError("Sort-merge join needs at least 3 memory blocks, got " + std::to_string(memory_blocks));
    checkJoinKeys(left_key, right_key);
    checkKeyColumns(left->getSchema(), left_key, "Left join key");
    checkKeyColumns(right->getSchema(), right_key, "Right join key");
    schema = Schema::concat(left->getSchema(), right->getSchema());
}

Partition SortMergeJoin::sortInput(OperatorBase& input, const std::vector<size_t>& key, const std::string& side) {
    std::vector<SortKey> sort_keys;
    for (size_t column : key)
        sort_keys.emplace_back(column);
    ExternalSorter sorter(context, getBudget(), stats.io, makeRowComparator(sort_keys), getMemoryBlocks(), getName() + "-" + side);
    input.open();
    Row row;
    while (input.next(row)) {
        // null keys never match, so they are not worth sorting
        if (!hasNullKey(row, key))
            sorter.add(std::move(row));
    }
    input.close();
    Partition run = sorter.finishToRun();
    initial_runs += sorter.getInitialRunCount();
    merge_passes += sorter.getMergePassCount();
    return run;
}

void SortMergeJoin::openImpl() {
    initial_runs = 0;
    merge_passes = 0;
    group.clear();
    group_rows = 0;
    group_position = 0;
    emitting = false;

    // both sorts finish before any input is streamed, so each of them can use the whole budget
    if (!left_sorted)
        left_run = sortInput(*left, left_key, "left");
    if (!right_sorted)
        right_run = sortInput(*right, right_key, "right");

    if (left_sorted) {
        left->open();
        left_cursor.source = left.get();
    } else {
        left_reader = left_run.scan(getBudget(), stats.io);
        left_cursor.source = left_reader.get();
    }
    if (right_sorted) {
        right->open();
        right_cursor.source = right.get();
    } else {
        right_reader = right_run.scan(getBudget(), stats.io);
        right_cursor.source = right_reader.get();
    }
    left_cursor.key = &left_key;
    right_cursor.key = &right_key;
    left_cursor.advance();
    right_cursor.advance();
}

const Row& SortMergeJoin::getGroupRow(size_t row_id) const {
    const size_t capacity = context.getBlockCapacity();
    return group[row_id / capacity]->getRow(row_id % capacity);
}

void SortMergeJoin::bufferLeftGroup() {
    group.clear();
    group_rows = 0;
    do {
        if (group.empty() || group.back()->full()) {
            if (group.size() >= max_group_blocks)
                throw ConfigurationError("Equal-key group of " + getName() + " exceeds " + std::to_string(max_group_blocks) + " blocks");
            group.push_back(allocateBlock());
        }
        group.back()->addRow(std::move(left_cursor.current));
        group_rows++;
        left_cursor.advance();
    } while (left_cursor.valid && compareKeys(left_cursor.current, left_key, getGroupRow(0), left_key) == 0);
    if (group.size() > largest_group_blocks)
        largest_group_blocks = group.size();
}

bool SortMergeJoin::nextImpl(Row& row) {
    while (true) {
        if (emitting) {
            if (group_position < group_rows) {
                row = concatRows(getGroupRow(group_position++), right_cursor.current);
                return true;
            }
            // the group has been crossed with the current right row
            right_cursor.advance();
            if (right_cursor.valid && compareKeys(getGroupRow(0), left_key, right_cursor.current, right_key) == 0) {
                group_position = 0;
                continue;
            }
            emitting = false;
            group.clear();
            group_rows = 0;
            continue;
        }

        if (!left_cursor.valid || !right_cursor.valid)
            return false;
        const int cmp = compareKeys(left_cursor.current, left_key, right_cursor.current, right_key);
        if (cmp < 0) {
            left_cursor.advance();
        } else if (cmp > 0) {
            right_cursor.advance();
        } else {
            bufferLeftGroup();
            group_position = 0;
            emitting = true;
        }
    }
}

void SortMergeJoin::closeImpl() {
    left_cursor = Cursor();
    right_cursor = Cursor();
    left_reader.reset();
    right_reader.reset();
    group.clear();
    group_rows = 0;
    emitting = false;
    left_run.drop();
    right_run.drop();
}

void SortMergeJoin::describe(std::ostream& out) const {
    out << "runs: " << initial_runs << ", merge passes: " << merge_passes << ", largest group: " << largest_group_blocks << " blocks";
}
