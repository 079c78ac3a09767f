#include "temp_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

#include "row_serializer.hpp"
#include "../core/errors.hpp"
#include "../utils/errno.hpp"

Partition::Partition()
    : store(nullptr)
    , id(MOVED)
    , budget(nullptr)
    , io_stats(nullptr)
    , block_capacity(1)
    , row_count(0)
    , write_offset(0)
    , writing_finished(false) { }

Partition::Partition(TempStore& store, uint64_t id, const std::string& name, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats)
    : store(&store)
    , id(id)
    , name(name)
    , budget(&budget)
    , io_stats(&io_stats)
    , block_capacity(block_capacity)
    , row_count(0)
    , write_offset(0)
    , writing_finished(false) { }

Partition::~Partition() {
    drop();
}

Partition::Partition(Partition&& other)
    : store(other.store)
    , id(other.id)
    , name(std::move(other.name))
    , budget(other.budget)
    , io_stats(other.io_stats)
    , block_capacity(other.block_capacity)
    , write_buffer(std::move(other.write_buffer))
    , row_count(other.row_count)
    , write_offset(other.write_offset)
    , writing_finished(other.writing_finished) {
    other.id = MOVED;
}

Partition& Partition::operator=(Partition&& other) {
    if (this == &other)
        return *this;
    drop();
    store = other.store;
    id = other.id;
    name = std::move(other.name);
    budget = other.budget;
    io_stats = other.io_stats;
    block_capacity = other.block_capacity;
    write_buffer = std::move(other.write_buffer);
    row_count = other.row_count;
    write_offset = other.write_offset;
    writing_finished = other.writing_finished;
    other.id = MOVED;
    return *this;
}

void Partition::checkWritable() const {
    if (id == MOVED)
        throw std::runtime_error("Partition has already been dropped");
    if (writing_finished)
        throw std::runtime_error("Partition '" + name + "' is no longer writable");
}

void Partition::append(Row&& row) {
    checkWritable();
    if (!write_buffer)
        write_buffer = std::make_unique<Block>(*budget, block_capacity);
    if (write_buffer->full()) {
        writeRecord(write_buffer->begin(), write_buffer->end());
        write_buffer->clear();
    }
    write_buffer->addRow(std::move(row));
    row_count++;
}

void Partition::append(const Row& row) {
    append(Row(row));
}

void Partition::writeBlock(const Block& block) {
    checkWritable();
    if (block.empty())
        return;
    flush();
    writeRecord(block.begin(), block.end());
    row_count += block.getCurrentSize();
}

void Partition::flush() {
    if (id == MOVED)
        throw std::runtime_error("Partition has already been dropped");
    if (write_buffer && !write_buffer->empty()) {
        writeRecord(write_buffer->begin(), write_buffer->end());
        write_buffer->clear();
    }
}

void Partition::releaseWriteBuffer() {
    flush();
    write_buffer.reset();
}

void Partition::finishWriting() {
    if (writing_finished)
        return;
    releaseWriteBuffer();
    writing_finished = true;
}

void Partition::writeRecord(std::vector<Row>::const_iterator begin, std::vector<Row>::const_iterator end) {
    std::string record(sizeof(BlockRecordHeader), '\0');
    uint32_t num_rows = 0;
    for (auto it = begin; it != end; ++it) {
        serializeRow(*it, record);
        num_rows++;
    }
    BlockRecordHeader header;
    header.magic = BLOCK_RECORD_MAGIC;
    header.row_count = num_rows;
    header.payload_size = record.size() - sizeof(BlockRecordHeader);
    std::memcpy(&record[0], &header, sizeof(header));

    store->writeAt(id, record.data(), record.size(), write_offset);
    write_offset += record.size();
    io_stats->blocks_written++;
}

std::unique_ptr<PartitionReader> Partition::scan() {
    return scan(*budget, *io_stats);
}

std::unique_ptr<PartitionReader> Partition::scan(MemoryBudget& reader_budget, IOStats& reader_io_stats) {
    if (id == MOVED)
        throw std::runtime_error("Partition has already been dropped");
    if (!writing_finished)
        throw std::runtime_error("Partition '" + name + "' cannot be scanned while it is being written");
    return std::make_unique<PartitionReader>(*store, id, write_offset, reader_budget, block_capacity, reader_io_stats);
}

void Partition::drop() {
    if (id == MOVED)
        return;
    write_buffer.reset();
    store->release(id);
    id = MOVED;
}

PartitionReader::PartitionReader(TempStore& store, uint64_t partition_id, uint64_t end_offset, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats)
    : store(store)
    , partition_id(partition_id)
    , end_offset(end_offset)
    , offset(0)
    , io_stats(io_stats)
    , buffer(budget, block_capacity)
    , position(0) { }

bool PartitionReader::next(Row& row) {
    while (position >= buffer.getCurrentSize()) {
        if (!loadNextBlock())
            return false;
    }
    row = std::move(buffer.getRow(position++));
    return true;
}

bool PartitionReader::loadNextBlock() {
    buffer.clear();
    position = 0;
    if (offset >= end_offset)
        return false;

    BlockRecordHeader header;
    store.readAt(partition_id, reinterpret_cast<char*>(&header), sizeof(header), offset);
    if (header.magic != BLOCK_RECORD_MAGIC || header.row_count > buffer.getCapacity())
        throw ResourceError("Corrupted partition record at offset " + std::to_string(offset));
    record.resize(header.payload_size);
    if (header.payload_size > 0)
        store.readAt(partition_id, &record[0], header.payload_size, offset + sizeof(header));
    offset += sizeof(header) + header.payload_size;
    io_stats.blocks_read++;
    store.blocks_read++;

    const char* pos = record.data();
    const char* end = record.data() + record.size();
    for (uint32_t i = 0; i < header.row_count; i++)
        buffer.addRow(deserializeRow(pos, end));
    return true;
}

TempStore::TempStore(const std::string& directory, size_t max_open_files, bool verbose)
    : directory(directory)
    , max_open_files(max_open_files)
    , verbose(verbose)
    , created_directory(false)
    , next_id(0)
    , peak_live_partitions(0)
    , blocks_written(0)
    , blocks_read(0)
    , reopens(0) {
    if (max_open_files == 0)
        throw ConfigurationError("At least one partition file must be allowed to stay open");
    struct stat st;
    if (stat(directory.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode))
            throw ResourceError("Temporary directory '" + directory + "' is not a directory");
    } else {
        if (mkdir(directory.c_str(), 0700) != 0)
            throw ResourceError("Failed to create temporary directory '" + directory + "' (errno " + std::to_string(errno) + ", " + errnoStr() + ")");
        created_directory = true;
    }
    if (verbose)
        std::cout << "[tempstore] " << "Using temporary directory '" << directory << "'" << std::endl;
}

TempStore::~TempStore() {
    const size_t leaked = reclaimAll();
    if (leaked > 0)
        std::cout << "[tempstore] " << "Warning: Reclaimed " << leaked << " partitions on shutdown" << std::endl;
    if (verbose) {
        std::cout << "[tempstore] " << "Created " << next_id << " partitions, at most " << peak_live_partitions << " at a time" << std::endl;
        std::cout << "[tempstore] " << "Wrote " << blocks_written << " blocks, read " << blocks_read << " blocks" << std::endl;
        std::cout << "[tempstore] " << "Reopened partition files " << reopens << " times" << std::endl;
    }
    if (created_directory && rmdir(directory.c_str()) != 0)
        std::cout << "[tempstore] " << "Warning: Failed to remove temporary directory '" << directory << "' (errno " << errno << ", " << errnoStr() << ")" << std::endl;
}

Partition TempStore::createPartition(const std::string& name, MemoryBudget& budget, size_t block_capacity, IOStats& io_stats) {
    const uint64_t id = next_id++;
    PartitionFile file;
    file.path = directory + "/" + name + "." + std::to_string(id) + ".part";
    file.fd = openFile(file.path, O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC);
    if (file.fd < 0)
        throw ResourceError("Failed to create partition file '" + file.path + "' (errno " + std::to_string(errno) + ", " + errnoStr() + ")");
    PartitionFile& inserted = files.emplace(id, file).first->second;
    trackOpen(id, inserted);
    if (files.size() > peak_live_partitions)
        peak_live_partitions = files.size();
    return Partition(*this, id, name, budget, block_capacity, io_stats);
}

size_t TempStore::reclaimAll() {
    const size_t count = files.size();
    for (auto& entry : files)
        closeAndUnlink(entry.second);
    files.clear();
    open_files.clear();
    return count;
}

TempStore::PartitionFile& TempStore::getFile(uint64_t id) {
    auto it = files.find(id);
    if (it == files.end())
        throw ResourceError("Partition " + std::to_string(id) + " has already been reclaimed");
    return it->second;
}

int TempStore::openFile(const std::string& path, int flags) {
    while (true) {
        const int fd = open(path.c_str(), flags, 0600);
        if (fd >= 0 || (errno != EMFILE && errno != ENFILE) || open_files.empty())
            return fd;
        // the process limit is lower than 'max_open_files', make room and retry
        closeLeastRecentlyUsed();
    }
}

void TempStore::closeLeastRecentlyUsed() {
    PartitionFile& victim = files.at(open_files.back());
    if (close(victim.fd) != 0)
        std::cout << "[tempstore] " << "Error: Failed to close partition file '" << victim.path << "' (errno " << errno << ", " << errnoStr() << ")" << std::endl;
    victim.fd = -1;
    open_files.pop_back();
}

void TempStore::trackOpen(uint64_t id, PartitionFile& file) {
    open_files.push_front(id);
    file.lru_position = open_files.begin();
    while (open_files.size() > max_open_files)
        closeLeastRecentlyUsed();
}

int TempStore::acquireDescriptor(uint64_t id, PartitionFile& file) {
    if (file.fd >= 0) {
        open_files.splice(open_files.begin(), open_files, file.lru_position);
        return file.fd;
    }
    if (open_files.size() >= max_open_files)
        closeLeastRecentlyUsed();
    file.fd = openFile(file.path, O_RDWR | O_CLOEXEC);
    if (file.fd < 0)
        throw ResourceError("Failed to reopen partition file '" + file.path + "' (errno " + std::to_string(errno) + ", " + errnoStr() + ")");
    reopens++;
    trackOpen(id, file);
    return file.fd;
}

void TempStore::writeAt(uint64_t id, const char* data, size_t size, uint64_t offset) {
    PartitionFile& file = getFile(id);
    const int fd = acquireDescriptor(id, file);
    size_t written = 0;
    while (written < size) {
        ssize_t result = pwrite(fd, data + written, size - written, offset + written);
        if (result < 0) {
            if (errno == EINTR)
                continue;
            throw ResourceError("Failed to write partition file '" + file.path + "' (errno " + std::to_string(errno) + ", " + errnoStr() + ")");
        }
        written += static_cast<size_t>(result);
    }
    blocks_written++;
}

void TempStore::readAt(uint64_t id, char* data, size_t size, uint64_t offset) {
    PartitionFile& file = getFile(id);
    const int fd = acquireDescriptor(id, file);
    size_t read = 0;
    while (read < size) {
        ssize_t result = pread(fd, data + read, size - read, offset + read);
        if (result < 0) {
            if (errno == EINTR)
                continue;
            throw ResourceError("Failed to read partition file '" + file.path + "' (errno " + std::to_string(errno) + ", " + errnoStr() + ")");
        }
        if (result == 0)
            throw ResourceError("Unexpected end of partition file '" + file.path + "'");
        read += static_cast<size_t>(result);
    }
}

void TempStore::release(uint64_t id) {
    auto it = files.find(id);
    if (it == files.end())
        return; // already reclaimed at the end of the statement
    closeAndUnlink(it->second);
    files.erase(it);
}

void TempStore::closeAndUnlink(PartitionFile& file) {
    if (file.fd >= 0) {
        open_files.erase(file.lru_position);
        if (close(file.fd) != 0)
            std::cout << "[tempstore] " << "Error: Failed to close partition file '" << file.path << "' (errno " << errno << ", " << errnoStr() << ")" << std::endl;
        file.fd = -1;
    }
    if (unlink(file.path.c_str()) != 0)
        std::cout << "[tempstore] " << "Error: Failed to delete partition file '" << file.path << "' (errno " << errno << ", " << errnoStr() << ")" << std::endl;
}

PartitionWriterCache::PartitionWriterCache(size_t max_open_buffers) : max_open_buffers(max_open_buffers) {
    if (max_open_buffers == 0)
        throw std::runtime_error("PartitionWriterCache needs room for at least one write buffer");
}

void PartitionWriterCache::append(Partition& partition, Row&& row) {
    auto it = positions.find(&partition);
    if (it != positions.end()) {
        lru.splice(lru.begin(), lru, it->second);
    } else {
        if (lru.size() >= max_open_buffers) {
            Partition* victim = lru.back();
            victim->releaseWriteBuffer();
            positions.erase(victim);
            lru.pop_back();
        }
        lru.push_front(&partition);
        positions[&partition] = lru.begin();
    }
    partition.append(std::move(row));
}

void PartitionWriterCache::clear() {
    lru.clear();
    positions.clear();
}
