#include "sort.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

#include "../core/errors.hpp"

RowComparator makeRowComparator(const std::vector<SortKey>& keys, bool tiebreak_all_columns) {
    return [=](const Row& a, const Row& b) -> int {
        int cmp = 0;
        size_t i = 0;
        while (cmp == 0 && i < keys.size()) {
            const SortKey& key = keys[i++];
            cmp = a[key.column].compare(b[key.column]);
            cmp *= key.order == Order::Ascending ? 1 : -1;
        }
        if (cmp == 0 && tiebreak_all_columns) {
            for (size_t column = 0; cmp == 0 && column < a.size(); column++)
                cmp = a[column].compare(b[column]);
        }
        return cmp;
    };
}

template<class It, class Compare>
It selectPivot(It first, It last, Compare comp) {
    It mid = first + (last - first) / 2;
    if (comp(*last, *first) < 0)
        swap(*first, *last);
    if (comp(*mid, *first) < 0)
        swap(*first, *mid);
    if (comp(*last, *mid) < 0)
        swap(*mid, *last);
    return mid;
}

template<class It, class Compare>
It quicksortPartition(It begin, It end, Compare comp) {
    It pivot = selectPivot(begin, end - 1, comp);
    typename It::difference_type count = 0;
    for (It it = begin; it < end; ++it) {
        if (comp(*it, *pivot) < 0)
            count++;
    }
    if (count != pivot - begin) {
        swap(*pivot, *(begin + count));
        pivot = begin + count;
    }

    // move smaller elements left and the others right of the pivot
    It i = begin, j = end - 1;
    while (i < pivot && j > pivot) {
        while (comp(*i, *pivot) < 0)
            i++;
        while (comp(*j, *pivot) >= 0 && j > pivot)
            j--;
        if (i < pivot && j > pivot)
            swap(*i++, *j--);
    }
    return pivot;
}

template<class It, class Compare>
void insertionsort(It begin, It end, Compare comp) {
    for (It i = begin + 1; i < end; ++i) {
        for (It j = i; j != begin && comp(*(j - 1), *j) > 0; --j)
            swap(*j, *(j - 1));
    }
}

template<class It, class Compare>
void siftDown(It begin, It end, It root, Compare comp) {
    while (begin + (root - begin) * 2 + 1 < end) {
        It child = begin + (root - begin) * 2 + 1;
        if (child + 1 < end && comp(*child, *(child + 1)) < 0)
            child = child + 1;
        if (comp(*root, *child) >= 0)
            return;
        swap(*root, *child);
        root = child;
    }
}

template<class It, class Compare>
void heapsort(It begin, It end, Compare comp) {
    for (It start = end - 1; start > begin;) {
        --start;
        siftDown(begin, end, start, comp);
    }
    while (end != begin + 1) {
        --end;
        swap(*begin, *end);
        siftDown(begin, end, begin, comp);
    }
}

template<class It, class Compare>
void introsort(It begin, It end, Compare comp, size_t maxdepth) {
    if (begin >= end)
        return;

    const typename It::difference_type n = end - begin;
    if (n < 16) {
        insertionsort(begin, end, comp);
    } else if (maxdepth == 0) {
        heapsort(begin, end, comp);
    } else {
        It p = quicksortPartition(begin, end, comp);
        introsort(begin, p, comp, maxdepth - 1);
        introsort(p + 1, end, comp, maxdepth - 1);
    }
}

template<class It, class Compare>
void introsort(It begin, It end, Compare comp) {
    const typename It::difference_type n = end - begin;
    if (n < 2)
        return;
    size_t maxdepth = (8 * sizeof(unsigned long) - __builtin_clzl(n - 1)) * 2; // log2(n) * 2
    introsort(begin, end, comp, maxdepth);
#ifndef NDEBUG
    for (It it = begin; it < end - 1; ++it)
        assert(comp(*it, *(it + 1)) <= 0);
#endif
}

RunBuffer::RunBuffer(MemoryBudget& budget, size_t block_capacity, size_t max_blocks)
    : budget(budget)
    , block_capacity(block_capacity)
    , max_blocks(max_blocks)
    , row_count(0) { }

bool RunBuffer::addRow(Row&& row) {
    if (blocks.empty() || blocks.back()->full()) {
        if (blocks.size() >= max_blocks)
            return false;
        blocks.push_back(std::make_unique<Block>(budget, block_capacity));
    }
    blocks.back()->addRow(std::move(row));
    row_count++;
    return true;
}

void RunBuffer::sort(const RowComparator& comp) {
    introsort(begin(), end(), comp);
}

void RunBuffer::clear() {
    blocks.clear();
    row_count = 0;
}

bool BufferReader::next(Row& row) {
    if (position >= buffer->getRowCount())
        return false;
    row = std::move(buffer->getRow(position++));
    return true;
}

MergingReader::MergingReader(std::vector<Partition>&& runs, const RowComparator& comp, MemoryBudget& budget, IOStats& io_stats)
    : runs(std::move(runs))
    , comp(comp) {
    readers.reserve(this->runs.size());
    heap.reserve(this->runs.size());
    for (size_t i = 0; i < this->runs.size(); i++) {
        readers.push_back(this->runs[i].scan(budget, io_stats));
        Entry entry;
        entry.run = i;
        if (readers.back()->next(entry.row))
            heap.push_back(std::move(entry));
    }
    std::make_heap(heap.begin(), heap.end(), [this](const Entry& a, const Entry& b) { return heapLess(a, b); });
}

// std heaps keep the greatest element on top, so the smallest row (and among equal rows the lowest run) must compare greatest
bool MergingReader::heapLess(const Entry& a, const Entry& b) const {
    const int cmp = comp(a.row, b.row);
    if (cmp != 0)
        return cmp > 0;
    return a.run > b.run;
}

bool MergingReader::next(Row& row) {
    if (heap.empty())
        return false;
    auto less = [this](const Entry& a, const Entry& b) { return heapLess(a, b); };
    std::pop_heap(heap.begin(), heap.end(), less);
    Entry& top = heap.back();
    row = std::move(top.row);
    const size_t run = top.run;
    if (readers[run]->next(top.row)) {
        std::push_heap(heap.begin(), heap.end(), less);
    } else {
        heap.pop_back();
        readers[run].reset(); // frees the read buffer early
    }
    return true;
}

DeduplicatingReader::DeduplicatingReader(std::unique_ptr<RowSource> input, const RowComparator& comp)
    : input(std::move(input))
    , comp(comp)
    , has_last(false) { }

bool DeduplicatingReader::next(Row& row) {
    while (input->next(row)) {
        if (has_last && comp(row, last) == 0)
            continue;
        last = row;
        has_last = true;
        return true;
    }
    return false;
}

ExternalSorter::ExternalSorter(ExecutionContext& context, MemoryBudget& budget, IOStats& io_stats, const RowComparator& comp, size_t memory_blocks, const std::string& name)
    : context(context)
    , budget(budget)
    , io_stats(io_stats)
    , comp(comp)
    , memory_blocks(memory_blocks)
    , name(name)
    , row_count(0)
    , initial_runs(0)
    , merge_passes(0)
    , next_run_id(0)
    , finished(false) {
    if (memory_blocks < 3)
        throw ConfigurationError("External sort needs at least 3 memory blocks, got " + std::to_string(memory_blocks));
    buffer = std::make_unique<RunBuffer>(budget, context.getBlockCapacity(), memory_blocks);
}

void ExternalSorter::checkNotFinished() {
    if (finished)
        throw std::runtime_error("ExternalSorter " + name + " has already been finished");
}

void ExternalSorter::add(Row&& row) {
    checkNotFinished();
    if (!buffer->addRow(std::move(row))) {
        spillRun();
        buffer->addRow(std::move(row));
    }
    row_count++;
}

Partition ExternalSorter::createRun() {
    return context.getTempStore().createPartition(name + "-run" + std::to_string(next_run_id++), budget, context.getBlockCapacity(), io_stats);
}

void ExternalSorter::spillRun() {
    buffer->sort(comp);
    Partition run = createRun();
    // the sorted blocks are written directly, so no additional write buffer is needed
    for (auto& block : buffer->getBlocks())
        run.writeBlock(*block);
    run.finishWriting();
    buffer->clear();
    runs.push_back(std::move(run));
    initial_runs++;
}

void ExternalSorter::mergeDownTo(size_t max_runs) {
    const size_t fan_in = memory_blocks - 1; // one block is reserved for the output
    while (runs.size() > max_runs) {
        std::deque<Partition> merged_runs;
        while (!runs.empty()) {
            std::vector<Partition> group;
            while (!runs.empty() && group.size() < fan_in) {
                group.push_back(std::move(runs.front()));
                runs.pop_front();
            }
            if (group.size() == 1) {
                merged_runs.push_back(std::move(group.front()));
                continue;
            }
            Partition output = createRun();
            {
                MergingReader reader(std::move(group), comp, budget, io_stats);
                Row row;
                while (reader.next(row))
                    output.append(std::move(row));
            }
            output.finishWriting();
            merged_runs.push_back(std::move(output));
        }
        runs = std::move(merged_runs);
        merge_passes++;
        if (context.isVerbose())
            std::cout << "[sort] " << name << ": merge pass " << merge_passes << " left " << runs.size() << " runs" << std::endl;
    }
}

std::unique_ptr<RowSource> ExternalSorter::finish() {
    checkNotFinished();
    finished = true;
    if (runs.empty()) {
        buffer->sort(comp);
        return std::make_unique<BufferReader>(std::move(buffer));
    }
    if (!buffer->empty())
        spillRun();
    buffer.reset();
    mergeDownTo(memory_blocks - 1);
    if (runs.size() > 1)
        merge_passes++; // the final merge happens while the rows are consumed
    std::vector<Partition> remaining;
    for (auto& run : runs)
        remaining.push_back(std::move(run));
    runs.clear();
    return std::make_unique<MergingReader>(std::move(remaining), comp, budget, io_stats);
}

Partition ExternalSorter::finishToRun() {
    checkNotFinished();
    finished = true;
    if (!buffer->empty() || runs.empty())
        spillRun();
    buffer.reset();
    mergeDownTo(1);
    Partition result = std::move(runs.front());
    runs.clear();
    return result;
}

SortOperator::SortOperator(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<SortKey>& keys, size_t memory_blocks, bool deduplicate)
    : OperatorBase(context, deduplicate ? "distinct_sort" : "sort", memory_blocks)
    , input(input)
    , keys(keys)
    , deduplicate(deduplicate)
    , comp(makeRowComparator(keys, deduplicate))
    , initial_runs(0)
    , merge_passes(0) {
    addChild(input);
    if (memory_blocks < 3)
        throw ConfigurationError("Sort needs at least 3 memory blocks, got " + std::to_string(memory_blocks));
    if (keys.empty() && !deduplicate)
        throw std::runtime_error("Sort requires at least one sort key");
    for (auto& key : keys) {
        if (key.column >= input->getSchema().size())
            throw std::runtime_error("Sort key column " + std::to_string(key.column) + " is out of range");
    }
    schema = input->getSchema();
}

void SortOperator::openImpl() {
    sorter = std::make_unique<ExternalSorter>(context, getBudget(), stats.io, comp, getMemoryBlocks(), getName());
    input->open();
    Row row;
    while (input->next(row))
        sorter->add(std::move(row));
    input->close();
    output = sorter->finish();
    if (deduplicate)
        output = std::make_unique<DeduplicatingReader>(std::move(output), comp);
    initial_runs = sorter->getInitialRunCount();
    merge_passes = sorter->getMergePassCount();
}

bool SortOperator::nextImpl(Row& row) {
    return output->next(row);
}

void SortOperator::closeImpl() {
    output.reset();
    sorter.reset();
}

void SortOperator::describe(std::ostream& out) const {
    out << "runs: " << initial_runs << ", merge passes: " << merge_passes;
}
