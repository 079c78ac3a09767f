#include "hash_join.hpp"

#include <limits>

#include "key.hpp"
#include "nested_loop_join.hpp"
#include "scan.hpp"
#include "../core/errors.hpp"

void HashJoin::Bucket::append(Row&& row, uint64_t hash) {
    if (partition.getRowCount() == 0)
        first_hash = hash;
    else if (hash != first_hash)
        uniform_hash = false;
    partition.append(std::move(row));
}

HashJoin::HashJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> left, std::shared_ptr<OperatorBase> right, const std::vector<size_t>& left_key, const std::vector<size_t>& right_key, size_t memory_blocks)
    : OperatorBase(context, "hash_join", memory_blocks)
    , left(left)
    , right(right)
    , left_key(left_key)
    , right_key(right_key)
    , fan_out(memory_blocks >= 1 ? memory_blocks - 1 : 0)
    , max_depth(context.getConfig().hash_max_depth)
    , phase(Phase::Idle)
    , build_left(true)
    , match_position(0)
    , max_depth_reached(0)
    , fallbacks(0)
    , partitions_created(0)
    , probed_pairs(0) {
    addChild(left);
    addChild(right);
    if (memory_blocks < 3)
        throw ConfigurationError("Hash join needs at least 3 memory blocks, got " + std::to_string(memory_blocks));
    checkJoinKeys(left_key, right_key);
    checkKeyColumns(left->getSchema(), left_key, "Left join key");
    checkKeyColumns(right->getSchema(), right_key, "Right join key");
    schema = Schema::concat(left->getSchema(), right->getSchema());
}

HashJoin::~HashJoin() { }

void HashJoin::openImpl() {
    max_depth_reached = 0;
    fallbacks = 0;
    partitions_created = 0;
    probed_pairs = 0;
    phase = Phase::Idle;

    std::vector<Bucket> left_buckets(fan_out);
    std::vector<Bucket> right_buckets(fan_out);
    input_block = allocateBlock();
    partitionInput(*left, left_key, "left", left_buckets);
    partitionInput(*right, right_key, "right", right_buckets);
    input_block.reset();
    pushPairs(left_buckets, right_buckets, 0, fan_out);
}

void HashJoin::partitionInput(OperatorBase& input, const std::vector<size_t>& key, const std::string& side, std::vector<Bucket>& buckets) {
    input.open();
    while (input.nextBlock(*input_block)) {
        for (Row& row : *input_block) {
            if (hasNullKey(row, key))
                continue;
            const uint64_t hash = hashKey(row, key);
            Bucket& bucket = buckets[hash % fan_out];
            if (!bucket.partition.isValid()) {
                bucket.partition = createPartition(side + "-d0-b" + std::to_string(hash % fan_out));
                partitions_created++;
            }
            bucket.append(std::move(row), hash);
        }
    }
    input.close();
    for (auto& bucket : buckets) {
        if (bucket.partition.isValid())
            bucket.partition.finishWriting();
    }
}

void HashJoin::repartition(Bucket& source, const std::vector<size_t>& key, const std::string& side, uint64_t modulus, std::vector<Bucket>& buckets) {
    std::unique_ptr<PartitionReader> reader = source.partition.scan(getBudget(), stats.io);
    Row row;
    while (reader->next(row)) {
        const uint64_t hash = hashKey(row, key);
        const size_t bucket_id = (hash / modulus) % fan_out;
        Bucket& bucket = buckets[bucket_id];
        if (!bucket.partition.isValid()) {
            bucket.partition = createPartition(side + "-m" + std::to_string(modulus) + "-b" + std::to_string(bucket_id));
            partitions_created++;
        }
        bucket.append(std::move(row), hash);
    }
    reader.reset();
    source.partition.drop();
    for (auto& bucket : buckets) {
        if (bucket.partition.isValid())
            bucket.partition.finishWriting();
    }
}

void HashJoin::pushPairs(std::vector<Bucket>& left_buckets, std::vector<Bucket>& right_buckets, size_t depth, uint64_t modulus) {
    // pushed in reverse so that the pairs are processed in bucket order
    for (size_t i = fan_out; i-- > 0;) {
        if (!left_buckets[i].partition.isValid() || !right_buckets[i].partition.isValid())
            continue; // a bucket without partner cannot produce results, its partition is dropped with the vector
        WorkItem item;
        item.left = std::move(left_buckets[i]);
        item.right = std::move(right_buckets[i]);
        item.depth = depth;
        item.modulus = modulus;
        work_stack.push_back(std::move(item));
    }
}

bool HashJoin::fitsInMemory(const Bucket& bucket) const {
    return bucket.partition.getBlockCount() <= fan_out;
}

bool HashJoin::startNextPair() {
    while (!work_stack.empty()) {
        current = std::move(work_stack.back());
        work_stack.pop_back();
        if (current.depth > max_depth_reached)
            max_depth_reached = current.depth;

        if (fitsInMemory(current.left) && fitsInMemory(current.right)) {
            startProbe();
            return true;
        }

        const bool degenerate = (!fitsInMemory(current.left) && current.left.uniform_hash) || (!fitsInMemory(current.right) && current.right.uniform_hash);
        const bool modulus_overflow = current.modulus > std::numeric_limits<uint64_t>::max() / fan_out;
        if (degenerate || current.depth >= max_depth || modulus_overflow) {
            if (context.isVerbose()) {
                std::cout << "[hashjoin] " << getName() << ": nested-loop fallback at depth " << current.depth << " for " << current.left.partition.getRowCount()
                          << " x " << current.right.partition.getRowCount() << " rows" << (degenerate ? " (degenerate bucket)" : "") << std::endl;
            }
            startFallback();
            return true;
        }

        if (context.isVerbose()) {
            std::cout << "[hashjoin] " << getName() << ": repartitioning " << current.left.partition.getRowCount() << " x " << current.right.partition.getRowCount()
                      << " rows at depth " << current.depth + 1 << std::endl;
        }
        std::vector<Bucket> left_buckets(fan_out);
        std::vector<Bucket> right_buckets(fan_out);
        repartition(current.left, left_key, "left", current.modulus, left_buckets);
        repartition(current.right, right_key, "right", current.modulus, right_buckets);
        pushPairs(left_buckets, right_buckets, current.depth + 1, current.modulus * fan_out);
    }
    return false;
}

void HashJoin::startProbe() {
    probed_pairs++;
    build_left = current.left.partition.getRowCount() <= current.right.partition.getRowCount();
    Partition& build = build_left ? current.left.partition : current.right.partition;
    Partition& probe = build_left ? current.right.partition : current.left.partition;
    const std::vector<size_t>& build_key = build_left ? left_key : right_key;

    {
        std::unique_ptr<PartitionReader> reader = build.scan(getBudget(), stats.io);
        Row row;
        while (reader->next(row)) {
            if (build_blocks.empty() || build_blocks.back()->full())
                build_blocks.push_back(allocateBlock());
            build_blocks.back()->addRow(std::move(row));
        }
    }
    // the blocks are complete, so the row addresses are stable from here on
    for (auto& block : build_blocks) {
        for (const Row& row : *block)
            hash_table.emplace(hashKey(row, build_key), &row);
    }
    probe_reader = probe.scan(getBudget(), stats.io);
    matches.clear();
    match_position = 0;
    phase = Phase::Probe;
}

void HashJoin::startFallback() {
    fallbacks++;
    fallback_left = std::make_shared<PartitionScan>(context, current.left.partition, left->getSchema());
    fallback_right = std::make_shared<PartitionScan>(context, current.right.partition, right->getSchema());
    fallback = std::make_unique<BlockNestedLoopJoin>(context, fallback_left, fallback_right, makeEquiJoinPredicate(left_key, right_key), getMemoryBlocks());
    fallback->open();
    phase = Phase::Fallback;
}

bool HashJoin::nextProbeRow(Row& row) {
    while (true) {
        if (match_position < matches.size()) {
            const Row& match = *matches[match_position++];
            row = build_left ? concatRows(match, probe_row) : concatRows(probe_row, match);
            return true;
        }
        if (!probe_reader->next(probe_row))
            return false;
        matches.clear();
        match_position = 0;
        const std::vector<size_t>& probe_key = build_left ? right_key : left_key;
        auto range = hash_table.equal_range(hashKey(probe_row, probe_key));
        for (auto it = range.first; it != range.second; ++it) {
            const bool equal = build_left ? keysEqual(*it->second, left_key, probe_row, right_key) : keysEqual(probe_row, left_key, *it->second, right_key);
            if (equal)
                matches.push_back(it->second);
        }
    }
}

void HashJoin::finishPair() {
    probe_reader.reset();
    hash_table.clear();
    build_blocks.clear();
    matches.clear();
    match_position = 0;
    if (fallback) {
        fallback->close();
        fallback.reset();
    }
    fallback_left.reset();
    fallback_right.reset();
    current.left.partition.drop();
    current.right.partition.drop();
    phase = Phase::Idle;
}

bool HashJoin::nextImpl(Row& row) {
    while (true) {
        if (phase == Phase::Probe) {
            if (nextProbeRow(row))
                return true;
            finishPair();
        } else if (phase == Phase::Fallback) {
            if (fallback->next(row))
                return true;
            finishPair();
        }
        if (!startNextPair())
            return false;
    }
}

void HashJoin::closeImpl() {
    finishPair();
    work_stack.clear();
    input_block.reset();
}

void HashJoin::describe(std::ostream& out) const {
    out << "fan-out: " << fan_out << ", max depth: " << max_depth_reached << ", fallbacks: " << fallbacks << ", partitions: " << partitions_created;
}
