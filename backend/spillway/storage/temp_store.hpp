#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>

#include "block.hpp"
#include "memory_budget.hpp"

struct IOStats {
    size_t blocks_read = 0;
    size_t blocks_written = 0;
};

class TempStore;
class PartitionReader;

// handle of a temporary partition: an append-only sequence of rows spilled to a scratch file;
// the file is deleted when the handle is dropped or destroyed
class Partition {
public:
    static const uint64_t MOVED = ~0ull;

    Partition();
    Partition(TempStore& store, uint64_t id, const std::string& name, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats);
    ~Partition();

    Partition(const Partition& other) = delete;
    Partition& operator=(const Partition& other) = delete;
    Partition(Partition&& other);
    Partition& operator=(Partition&& other);

    // buffers the row in a write buffer block which is allocated on first use
    void append(Row&& row);
    void append(const Row& row);
    // writes all rows of 'block' as one record, bypassing the write buffer
    void writeBlock(const Block& block);
    // writes the buffered rows, the write buffer stays allocated
    void flush();
    // writes the buffered rows and frees the write buffer; later appends allocate a new one
    void releaseWriteBuffer();
    // ends the write phase, afterwards the partition can be scanned but no longer appended to
    void finishWriting();

    // each scan holds one read buffer block, charged to the partition's budget unless another budget is given
    std::unique_ptr<PartitionReader> scan();
    std::unique_ptr<PartitionReader> scan(MemoryBudget& reader_budget, IOStats& reader_io_stats);

    void drop();

    bool isValid() const { return id != MOVED; }
    bool hasWriteBuffer() const { return write_buffer != nullptr; }
    bool isWritingFinished() const { return writing_finished; }
    uint64_t getRowCount() const { return row_count; }
    // logical size, i.e. the number of blocks needed to hold all rows in memory
    size_t getBlockCount() const { return (row_count + block_capacity - 1) / block_capacity; }
    const std::string& getName() const { return name; }

private:
    void checkWritable() const;
    void writeRecord(std::vector<Row>::const_iterator begin, std::vector<Row>::const_iterator end);

    TempStore* store;
    uint64_t id;
    std::string name;
    MemoryBudget* budget;
    IOStats* io_stats;
    size_t block_capacity;
    std::unique_ptr<Block> write_buffer;
    uint64_t row_count;
    uint64_t write_offset;
    bool writing_finished;
};

class PartitionReader : public RowSource {
public:
    PartitionReader(TempStore& store, uint64_t partition_id, uint64_t end_offset, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats);

    bool next(Row& row) override;

private:
    bool loadNextBlock();

    TempStore& store;
    const uint64_t partition_id;
    const uint64_t end_offset;
    uint64_t offset;
    IOStats& io_stats;
    Block buffer;
    size_t position;
    std::string record;
};

// scratch file manager; every partition created during a statement is reclaimed at the latest when the statement ends.
// At most 'max_open_files' partition files keep a descriptor, the least recently accessed ones are closed and
// reopened by path when they are accessed again.
class TempStore {
    friend class Partition;
    friend class PartitionReader;

public:
    TempStore(const std::string& directory, size_t max_open_files, bool verbose);
    ~TempStore();

    TempStore(const TempStore& other) = delete;
    TempStore& operator=(const TempStore& other) = delete;

    Partition createPartition(const std::string& name, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats);

    // closes and deletes every partition file that is still alive, returns their number
    size_t reclaimAll();

    size_t getLivePartitionCount() const { return files.size(); }
    size_t getPeakLivePartitionCount() const { return peak_live_partitions; }
    size_t getOpenFileCount() const { return open_files.size(); }
    uint64_t getReopenCount() const { return reopens; }
    uint64_t getCreatedPartitionCount() const { return next_id; }
    uint64_t getBlocksWritten() const { return blocks_written; }
    uint64_t getBlocksRead() const { return blocks_read; }
    const std::string& getDirectory() const { return directory; }

private:
    struct PartitionFile {
        int fd; // -1 while closed
        std::string path;
        std::list<uint64_t>::iterator lru_position;
    };

    PartitionFile& getFile(uint64_t id);
    // returns an open descriptor for the partition, reopening its file if necessary
    int acquireDescriptor(uint64_t id, PartitionFile& file);
    // opens with 'flags', closing the least recently used descriptors while the process runs out of them
    int openFile(const std::string& path, int flags);
    void closeLeastRecentlyUsed();
    void trackOpen(uint64_t id, PartitionFile& file);
    void writeAt(uint64_t id, const char* data, size_t size, uint64_t offset);
    void readAt(uint64_t id, char* data, size_t size, uint64_t offset);
    void release(uint64_t id);
    void closeAndUnlink(PartitionFile& file);

    const std::string directory;
    const size_t max_open_files;
    const bool verbose;
    bool created_directory;
    uint64_t next_id;
    std::unordered_map<uint64_t, PartitionFile> files;
    std::list<uint64_t> open_files; // most recently used first
    uint64_t reopens;
    size_t peak_live_partitions;
    uint64_t blocks_written;
    uint64_t blocks_read;
};

// keeps at most 'max_open_buffers' partitions with an attached write buffer; when another partition needs one,
// the buffer of the least recently used partition is flushed and released
class PartitionWriterCache {
public:
    explicit PartitionWriterCache(size_t max_open_buffers);

    void append(Partition& partition, Row&& row);
    // forgets all partitions without touching them
    void clear();

private:
    const size_t max_open_buffers;
    std::list<Partition*> lru;
    std::unordered_map<Partition*, std::list<Partition*>::iterator> positions;
};
