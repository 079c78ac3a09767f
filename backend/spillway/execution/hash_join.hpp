#pragma once

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "operator.hpp"

class BlockNestedLoopJoin;
class PartitionScan;

// Equi-join by recursive hash partitioning. Both inputs are split into F = 'memory_blocks - 1' buckets. A bucket
// pair whose sides both fit into F blocks is joined in memory, building a hash table from the smaller side.
// Otherwise the pair is split again by the next F-ary digit of the hash. A pair that cannot be split any further
// (all rows of an oversized side share one hash, or the maximum depth is reached) is joined by a block nested-loop
// join over the two buckets. The output consists of the left columns followed by the right columns.
class HashJoin : public OperatorBase {
public:
    HashJoin(ExecutionContext& context, std::shared_ptr<OperatorBase> left, std::shared_ptr<OperatorBase> right, const std::vector<size_t>& left_key, const std::vector<size_t>& right_key, size_t memory_blocks);
    ~HashJoin();

    size_t getMaxDepth() const { return max_depth_reached; }
    size_t getFallbackCount() const { return fallbacks; }
    size_t getPartitionsCreated() const { return partitions_created; }
    size_t getProbedPairCount() const { return probed_pairs; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    struct Bucket {
        Partition partition;
        uint64_t first_hash = 0;
        bool uniform_hash = true; // all rows share 'first_hash'

        void append(Row&& row, uint64_t hash);
    };

    // a bucket pair that still has to be joined; 'modulus' is the product of the fan-outs that led to it
    struct WorkItem {
        Bucket left;
        Bucket right;
        size_t depth = 0;
        uint64_t modulus = 1;
    };

    enum class Phase {
        Idle,
        Probe,
        Fallback
    };

    void partitionInput(OperatorBase& input, const std::vector<size_t>& key, const std::string& side, std::vector<Bucket>& buckets);
    void repartition(Bucket& source, const std::vector<size_t>& key, const std::string& side, uint64_t modulus, std::vector<Bucket>& buckets);
    void pushPairs(std::vector<Bucket>& left_buckets, std::vector<Bucket>& right_buckets, size_t depth, uint64_t modulus);
    bool startNextPair();
    bool fitsInMemory(const Bucket& bucket) const;
    void startProbe();
    void startFallback();
    bool nextProbeRow(Row& row);
    void finishPair();

    const std::shared_ptr<OperatorBase> left;
    const std::shared_ptr<OperatorBase> right;
    const std::vector<size_t> left_key;
    const std::vector<size_t> right_key;
    const size_t fan_out;
    const size_t max_depth;

    std::unique_ptr<Block> input_block;
    std::vector<WorkItem> work_stack;
    WorkItem current;
    Phase phase;

    // probe state
    bool build_left;
    std::vector<std::unique_ptr<Block>> build_blocks;
    std::unordered_multimap<uint64_t, const Row*> hash_table;
    std::unique_ptr<PartitionReader> probe_reader;
    Row probe_row;
    std::vector<const Row*> matches;
    size_t match_position;

    // fallback state
    std::shared_ptr<PartitionScan> fallback_left;
    std::shared_ptr<PartitionScan> fallback_right;
    std::unique_ptr<BlockNestedLoopJoin> fallback;

    size_t max_depth_reached;
    size_t fallbacks;
    size_t partitions_created;
    size_t probed_pairs;
};
