#pragma once

#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <vector>

#include "operator.hpp"

enum class Order {
    Ascending,
    Descending
};

struct SortKey {
    size_t column;
    Order order;

    SortKey(size_t column, Order order = Order::Ascending) : column(column), order(order) { }
};

typedef std::function<int(const Row&, const Row&)> RowComparator;

// compares by 'keys'; if 'tiebreak_all_columns' is set, rows with equal keys are ordered by all of their columns
RowComparator makeRowComparator(const std::vector<SortKey>& keys, bool tiebreak_all_columns = false);

// holds up to 'max_blocks' blocks of rows which are sorted in place before being written as a run
class RunBuffer {
public:
    struct Iterator {
        using iterator_category = std::random_access_iterator_tag;
        using difference_type = int64_t;
        using value_type = Row;
        using pointer = Row*;
        using reference = Row&;

        Iterator(RunBuffer& buffer, size_t row_id) : buffer(&buffer), row_id(row_id) { }

        reference operator*() const { return buffer->getRow(row_id); }

        friend bool operator==(const Iterator& a, const Iterator& b) { return a.buffer == b.buffer && a.row_id == b.row_id; }
        friend bool operator!=(const Iterator& a, const Iterator& b) { return a.buffer != b.buffer || a.row_id != b.row_id; }
        friend difference_type operator-(const Iterator& a, const Iterator& b) { return static_cast<difference_type>(a.row_id) - static_cast<difference_type>(b.row_id); }
        friend Iterator operator+(const Iterator& a, difference_type b) { return Iterator(*a.buffer, a.row_id + b); }
        friend Iterator operator+(difference_type a, const Iterator& b) { return Iterator(*b.buffer, b.row_id + a); }
        friend Iterator operator-(const Iterator& a, difference_type b) { return Iterator(*a.buffer, a.row_id - b); }
        friend bool operator<(const Iterator& a, const Iterator& b) { return a.row_id < b.row_id; }
        friend bool operator<=(const Iterator& a, const Iterator& b) { return a.row_id <= b.row_id; }
        friend bool operator>(const Iterator& a, const Iterator& b) { return a.row_id > b.row_id; }
        friend bool operator>=(const Iterator& a, const Iterator& b) { return a.row_id >= b.row_id; }

        Iterator operator++(int) { Iterator copy(*this); ++*this; return copy; }
        Iterator& operator++() { row_id++; return *this; }
        Iterator operator--(int) { Iterator copy(*this); --*this; return copy; }
        Iterator& operator--() { row_id--; return *this; }

    private:
        RunBuffer* buffer;
        size_t row_id;
    };

    RunBuffer(MemoryBudget& budget, size_t block_capacity, size_t max_blocks);

    // returns false without consuming 'row' if all blocks are full
    bool addRow(Row&& row);

    inline Row& getRow(size_t row_id) {
        return blocks[row_id / block_capacity]->getRow(row_id % block_capacity);
    }

    size_t getRowCount() const { return row_count; }
    bool empty() const { return row_count == 0; }
    const std::vector<std::unique_ptr<Block>>& getBlocks() const { return blocks; }

    void sort(const RowComparator& comp);
    // frees all blocks
    void clear();

    Iterator begin() { return Iterator(*this, 0); }
    Iterator end() { return Iterator(*this, row_count); }

private:
    MemoryBudget& budget;
    const size_t block_capacity;
    const size_t max_blocks;
    std::vector<std::unique_ptr<Block>> blocks;
    size_t row_count;
};

// streams the rows of a run buffer, keeping its blocks allocated until the reader is destroyed
class BufferReader : public RowSource {
public:
    explicit BufferReader(std::unique_ptr<RunBuffer> buffer) : buffer(std::move(buffer)), position(0) { }

    bool next(Row& row) override;

private:
    std::unique_ptr<RunBuffer> buffer;
    size_t position;
};

// k-way merge of sorted runs; rows comparing equal are produced in the order of their runs;
// the runs are owned by the reader and dropped together with it
class MergingReader : public RowSource {
public:
    MergingReader(std::vector<Partition>&& runs, const RowComparator& comp, MemoryBudget& budget, IOStats& io_stats);

    bool next(Row& row) override;

private:
    struct Entry {
        Row row;
        size_t run;
    };

    bool heapLess(const Entry& a, const Entry& b) const;

    std::vector<Partition> runs;
    std::vector<std::unique_ptr<PartitionReader>> readers;
    std::vector<Entry> heap;
    const RowComparator comp;
};

// suppresses rows that compare equal to their predecessor, so a sorted input yields each distinct row once
class DeduplicatingReader : public RowSource {
public:
    DeduplicatingReader(std::unique_ptr<RowSource> input, const RowComparator& comp);

    bool next(Row& row) override;

private:
    std::unique_ptr<RowSource> input;
    const RowComparator comp;
    Row last;
    bool has_last;
};

// Sorts an unbounded number of rows within 'memory_blocks' blocks: full buffers are sorted and spilled as runs,
// runs are merged 'memory_blocks - 1' at a time. If nothing was spilled, the rows are served from memory.
class ExternalSorter {
public:
    ExternalSorter(ExecutionContext& context, MemoryBudget& budget, IOStats& io_stats, const RowComparator& comp, size_t memory_blocks, const std::string& name);

    void add(Row&& row);
    // merges until at most 'memory_blocks - 1' runs are left and returns a reader that merges the rest on the fly
    std::unique_ptr<RowSource> finish();
    // merges down to a single sorted run
    Partition finishToRun();

    size_t getRowCount() const { return row_count; }
    size_t getInitialRunCount() const { return initial_runs; }
    size_t getMergePassCount() const { return merge_passes; }

private:
    Partition createRun();
    void spillRun();
    void mergeDownTo(size_t max_runs);
    void checkNotFinished();

    ExecutionContext& context;
    MemoryBudget& budget;
    IOStats& io_stats;
    const RowComparator comp;
    const size_t memory_blocks;
    const std::string name;
    std::unique_ptr<RunBuffer> buffer;
    std::deque<Partition> runs;
    size_t row_count;
    size_t initial_runs;
    size_t merge_passes;
    size_t next_run_id;
    bool finished;
};

class SortOperator : public OperatorBase {
public:
    // 'deduplicate' drops rows equal to another row in all columns
    SortOperator(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<SortKey>& keys, size_t memory_blocks, bool deduplicate = false);

    size_t getInitialRunCount() const { return initial_runs; }
    size_t getMergePassCount() const { return merge_passes; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    const std::shared_ptr<OperatorBase> input;
    const std::vector<SortKey> keys;
    const bool deduplicate;
    const RowComparator comp;
    std::unique_ptr<ExternalSorter> sorter;
    std::unique_ptr<RowSource> output;
    size_t initial_runs;
    size_t merge_passes;
};
