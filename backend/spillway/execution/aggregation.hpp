#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "aggregate_state.hpp"
#include "operator.hpp"

struct AggregateSpec {
    AggregateFunction function;
    size_t column; // ignored by COUNT(*)
    bool distinct;
    std::string name; // output column name, derived from the function if empty

    AggregateSpec(AggregateFunction function, size_t column = 0, bool distinct = false, const std::string& name = "")
        : function(function)
        , column(column)
        , distinct(distinct)
        , name(name) { }

    // DISTINCT aggregates need the complete set of values of a group
    bool isIncremental() const { return !distinct; }
};

// Grouped aggregation. Without DISTINCT aggregates the input is aggregated in a single pass into a hash table of
// per-group states. Otherwise the input rows are distributed into one temporary partition per group; each group is
// then aggregated separately, feeding every DISTINCT aggregate from an external sort of its values with adjacent
// duplicates removed. Groups for which 'having' returns false are not produced. The output consists of the group
// columns followed by the aggregate values; groups are produced in no particular order.
class Aggregation : public OperatorBase {
public:
    Aggregation(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<size_t>& group_by, const std::vector<AggregateSpec>& aggregates, size_t memory_blocks, const RowPredicate& having = nullptr);

    bool usesGroupPartitions() const { return !all_incremental; }
    size_t getGroupCount() const { return group_count; }
    size_t getDistinctSortRuns() const { return distinct_sort_runs; }
    void describe(std::ostream& out) const override;

protected:
    void openImpl() override;
    bool nextImpl(Row& row) override;
    void closeImpl() override;

private:
    struct GroupState {
        Row group_values;
        std::vector<std::unique_ptr<AggregateState>> states;
    };

    struct GroupPartition {
        Row group_values;
        Partition partition;
    };

    std::vector<std::unique_ptr<AggregateState>> createStates() const;
    void accumulate(const Row& row, std::vector<std::unique_ptr<AggregateState>>& states, bool incremental_only) const;
    Row finalizeGroup(const Row& group_values, const std::vector<std::unique_ptr<AggregateState>>& states) const;
    void consumeIncremental();
    void consumeIntoPartitions();
    Row aggregatePartition(GroupPartition& group);
    bool produceScalarRow(Row& row);

    const std::shared_ptr<OperatorBase> input;
    const std::vector<size_t> group_by;
    const std::vector<AggregateSpec> aggregates;
    const RowPredicate having;
    const bool all_incremental;

    std::unique_ptr<Block> input_block;
    std::unordered_map<std::string, GroupState> groups;
    std::unordered_map<std::string, GroupState>::iterator group_iterator;
    std::unordered_map<std::string, GroupPartition> group_partitions;
    std::unordered_map<std::string, GroupPartition>::iterator partition_iterator;
    bool scalar_pending; // an aggregate without GROUP BY over empty input still yields one row

    size_t group_count;
    size_t distinct_sort_runs;
};
