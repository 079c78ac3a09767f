#include "aggregation.hpp"

#include "key.hpp"
#include "sort.hpp"
#include "../core/errors.hpp"
#include "../storage/row_serializer.hpp"

namespace {

ValueType resultType(const AggregateSpec& aggregate, const Schema& input_schema) {
    switch (aggregate.function) {
        case AggregateFunction::CountStar:
        case AggregateFunction::Count:
            return ValueType::Integer;
        case AggregateFunction::Avg:
        case AggregateFunction::StddevPop:
            return ValueType::Float;
        case AggregateFunction::Sum:
            return input_schema.getColumns()[aggregate.column].type == ValueType::Float ? ValueType::Float : ValueType::Integer;
        case AggregateFunction::Min:
        case AggregateFunction::Max:
            return input_schema.getColumns()[aggregate.column].type;
    }
    return ValueType::Null;
}

bool allIncremental(const std::vector<AggregateSpec>& aggregates) {
    for (auto& aggregate : aggregates) {
        if (!aggregate.isIncremental())
            return false;
    }
    return true;
}

}

Aggregation::Aggregation(ExecutionContext& context, std::shared_ptr<OperatorBase> input, const std::vector<size_t>& group_by, const std::vector<AggregateSpec>& aggregates, size_t memory_blocks, const RowPredicate& having)
    : OperatorBase(context, "aggregation", memory_blocks)
    , input(input)
    , group_by(group_by)
    , aggregates(aggregates)
    , having(having)
    , all_incremental(allIncremental(aggregates))
    , scalar_pending(false)
    , group_count(0)
    , distinct_sort_runs(0) {
    addChild(input);
    if (memory_blocks < 1)
        throw ConfigurationError("Aggregation needs at least 1 memory block");
    if (!all_incremental && memory_blocks < 4)
        throw ConfigurationError("Aggregation with DISTINCT aggregates needs at least 4 memory blocks, got " + std::to_string(memory_blocks));

    const Schema& input_schema = input->getSchema();
    for (size_t column : group_by) {
        if (column >= input_schema.size())
            throw std::runtime_error("Group by column " + std::to_string(column) + " is out of range");
        schema.addColumn(input_schema.getColumns()[column].name, input_schema.getColumns()[column].type);
    }
    for (auto& aggregate : aggregates) {
        if (aggregate.function == AggregateFunction::CountStar) {
            if (aggregate.distinct)
                throw std::runtime_error("count(*) cannot be DISTINCT");
        } else if (aggregate.column >= input_schema.size()) {
            throw std::runtime_error(std::string("Input column of ") + aggregateFunctionName(aggregate.function) + " is out of range");
        }
        std::string name = aggregate.name;
        if (name.empty()) {
            name = aggregateFunctionName(aggregate.function);
            if (aggregate.function != AggregateFunction::CountStar)
                name += std::string("(") + (aggregate.distinct ? "distinct " : "") + input_schema.getColumns()[aggregate.column].name + ")";
        }
        schema.addColumn(name, resultType(aggregate, input_schema));
    }
}

std::vector<std::unique_ptr<AggregateState>> Aggregation::createStates() const {
    std::vector<std::unique_ptr<AggregateState>> states;
    states.reserve(aggregates.size());
    for (auto& aggregate : aggregates)
        states.push_back(createAggregateState(aggregate.function));
    return states;
}

void Aggregation::accumulate(const Row& row, std::vector<std::unique_ptr<AggregateState>>& states, bool incremental_only) const {
    for (size_t i = 0; i < aggregates.size(); i++) {
        const AggregateSpec& aggregate = aggregates[i];
        if (incremental_only && !aggregate.isIncremental())
            continue;
        if (aggregate.function == AggregateFunction::CountStar) {
            states[i]->update(Value::integer(1));
        } else if (!row[aggregate.column].isNull()) {
            states[i]->update(row[aggregate.column]);
        }
    }
}

Row Aggregation::finalizeGroup(const Row& group_values, const std::vector<std::unique_ptr<AggregateState>>& states) const {
    Row result = group_values;
    for (auto& state : states)
        result.push_back(state->finalize());
    return result;
}

void Aggregation::openImpl() {
    group_count = 0;
    distinct_sort_runs = 0;
    input_block = allocateBlock();
    if (all_incremental)
        consumeIncremental();
    else
        consumeIntoPartitions();
    input_block.reset();
    scalar_pending = group_by.empty() && group_count == 0;
}

void Aggregation::consumeIncremental() {
    input->open();
    std::string key;
    while (input->nextBlock(*input_block)) {
        for (const Row& row : *input_block) {
            key.clear();
            encodeGroupKey(row, group_by, key);
            auto it = groups.find(key);
            if (it == groups.end()) {
                GroupState group;
                group.group_values = projectRow(row, group_by);
                group.states = createStates();
                it = groups.emplace(key, std::move(group)).first;
            }
            accumulate(row, it->second.states, false);
        }
    }
    input->close();
    group_count = groups.size();
    group_iterator = groups.begin();
}

void Aggregation::consumeIntoPartitions() {
    // one block is the input buffer, the others are write buffers of the most recently used groups
    PartitionWriterCache writers(getMemoryBlocks() - 1);
    input->open();
    std::string key;
    while (input->nextBlock(*input_block)) {
        for (Row& row : *input_block) {
            key.clear();
            encodeGroupKey(row, group_by, key);
            auto it = group_partitions.find(key);
            if (it == group_partitions.end()) {
                GroupPartition group;
                group.group_values = projectRow(row, group_by);
                group.partition = createPartition("group" + std::to_string(group_partitions.size()));
                it = group_partitions.emplace(key, std::move(group)).first;
            }
            writers.append(it->second.partition, std::move(row));
        }
    }
    input->close();
    writers.clear();
    for (auto& entry : group_partitions)
        entry.second.partition.finishWriting();
    group_count = group_partitions.size();
    partition_iterator = group_partitions.begin();
    if (context.isVerbose())
        std::cout << "[aggregation] " << getName() << ": distributed input into " << group_count << " group partitions" << std::endl;
}

Row Aggregation::aggregatePartition(GroupPartition& group) {
    std::vector<std::unique_ptr<AggregateState>> states = createStates();

    bool has_incremental = false;
    for (auto& aggregate : aggregates)
        has_incremental |= aggregate.isIncremental();
    if (has_incremental) {
        std::unique_ptr<PartitionReader> reader = group.partition.scan(getBudget(), stats.io);
        Row row;
        while (reader->next(row))
            accumulate(row, states, true);
    }

    const RowComparator comp = makeRowComparator({SortKey(0)});
    for (size_t i = 0; i < aggregates.size(); i++) {
        const AggregateSpec& aggregate = aggregates[i];
        if (aggregate.isIncremental())
            continue;
        // the read buffer is released before the sorter merges, so both fit into the budget together
        ExternalSorter sorter(context, getBudget(), stats.io, comp, getMemoryBlocks() - 1, getName() + "-distinct" + std::to_string(i));
        {
            std::unique_ptr<PartitionReader> reader = group.partition.scan(getBudget(), stats.io);
            Row row;
            while (reader->next(row)) {
                if (!row[aggregate.column].isNull())
                    sorter.add(Row{std::move(row[aggregate.column])});
            }
        }
        DeduplicatingReader distinct_values(sorter.finish(), comp);
        Row value;
        while (distinct_values.next(value))
            states[i]->update(value[0]);
        distinct_sort_runs += sorter.getInitialRunCount();
    }

    group.partition.drop();
    return finalizeGroup(group.group_values, states);
}

bool Aggregation::produceScalarRow(Row& row) {
    scalar_pending = false;
    row = finalizeGroup(Row(), createStates());
    return !having || having(row);
}

bool Aggregation::nextImpl(Row& row) {
    if (scalar_pending)
        return produceScalarRow(row);
    if (all_incremental) {
        while (group_iterator != groups.end()) {
            row = finalizeGroup(group_iterator->second.group_values, group_iterator->second.states);
            ++group_iterator;
            if (!having || having(row))
                return true;
        }
        return false;
    }
    while (partition_iterator != group_partitions.end()) {
        row = aggregatePartition(partition_iterator->second);
        ++partition_iterator;
        if (!having || having(row))
            return true;
    }
    return false;
}

void Aggregation::closeImpl() {
    input_block.reset();
    groups.clear();
    group_iterator = groups.end();
    group_partitions.clear();
    partition_iterator = group_partitions.end();
    scalar_pending = false;
}

void Aggregation::describe(std::ostream& out) const {
    out << (all_incremental ? "hash" : "group partitions") << ", groups: " << group_count;
    if (!all_incremental)
        out << ", distinct sort runs: " << distinct_sort_runs;
}
