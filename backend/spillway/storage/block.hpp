#pragma once

#include <cstddef>
#include <vector>

#include "memory_budget.hpp"
#include "../core/row.hpp"

// fixed-capacity container of rows; every live block is charged to the memory budget it was created with
class Block {
public:
    Block(MemoryBudget& budget, size_t capacity);
    ~Block();

    Block(const Block& other) = delete;
    Block(Block&& other) = delete;
    Block& operator=(const Block& other) = delete;
    Block& operator=(Block&& other) = delete;

    // returns false if the block is already full
    inline bool addRow(Row&& row) {
        if (rows.size() >= capacity)
            return false;
        rows.push_back(std::move(row));
        return true;
    }

    inline bool addRow(const Row& row) {
        if (rows.size() >= capacity)
            return false;
        rows.push_back(row);
        return true;
    }

    inline Row& getRow(size_t row_id) { return rows[row_id]; }
    inline const Row& getRow(size_t row_id) const { return rows[row_id]; }

    size_t getCurrentSize() const { return rows.size(); }
    size_t getCapacity() const { return capacity; }
    bool empty() const { return rows.empty(); }
    bool full() const { return rows.size() >= capacity; }
    void clear() { rows.clear(); }

    std::vector<Row>::iterator begin() { return rows.begin(); }
    std::vector<Row>::iterator end() { return rows.end(); }
    std::vector<Row>::const_iterator begin() const { return rows.begin(); }
    std::vector<Row>::const_iterator end() const { return rows.end(); }

private:
    MemoryBudget& budget;
    const size_t capacity;
    std::vector<Row> rows;
};
