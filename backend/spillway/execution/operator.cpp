#include "operator.hpp"

#include <stdexcept>

#ifdef VTUNE_PROFILING
static __itt_domain* itt_domain = __itt_domain_create("spillway");
#endif

OperatorBase::OperatorBase(ExecutionContext& context, const std::string& type_name, size_t memory_blocks)
    : context(context)
    , name(type_name + "#" + std::to_string(context.getEngine().allocateOperatorId()))
    , memory_blocks(memory_blocks)
    , budget(std::make_unique<MemoryBudget>(memory_blocks, name))
    , opened(false)
    , exhausted(false) {
#ifdef VTUNE_PROFILING
    itt_handle = __itt_string_handle_create(name.c_str());
#endif
}

OperatorBase::~OperatorBase() { }

void OperatorBase::open() {
    if (opened)
        throw std::runtime_error("Operator " + name + " is already open");
    opened = true;
    exhausted = false;
    stats.opens++;
#ifdef VTUNE_PROFILING
    __itt_task_begin(itt_domain, __itt_null, __itt_null, itt_handle);
#endif
    try {
        openImpl();
    } catch (...) {
#ifdef VTUNE_PROFILING
        __itt_task_end(itt_domain);
#endif
        close();
        throw;
    }
#ifdef VTUNE_PROFILING
    __itt_task_end(itt_domain);
#endif
}

bool OperatorBase::next(Row& row) {
    if (!opened)
        throw std::runtime_error("Operator " + name + " is not open");
    if (exhausted)
        return false;
    stats.next_calls++;
#ifdef VTUNE_PROFILING
    __itt_task_begin(itt_domain, __itt_null, __itt_null, itt_handle);
#endif
    bool produced;
    try {
        produced = nextImpl(row);
    } catch (...) {
#ifdef VTUNE_PROFILING
        __itt_task_end(itt_domain);
#endif
        // partitions of the failing operator are reclaimed before the error reaches the caller
        close();
        throw;
    }
#ifdef VTUNE_PROFILING
    __itt_task_end(itt_domain);
#endif
    if (produced) {
        stats.rows_produced++;
    } else {
        exhausted = true;
        release();
    }
    return produced;
}

bool OperatorBase::nextBlock(Block& block) {
    block.clear();
    Row row;
    while (!block.full() && next(row))
        block.addRow(std::move(row));
    return !block.empty();
}

void OperatorBase::close() {
    if (!opened)
        return;
    opened = false;
    exhausted = false;
#ifdef VTUNE_PROFILING
    __itt_task_begin(itt_domain, __itt_null, __itt_null, itt_handle);
#endif
    release();
#ifdef VTUNE_PROFILING
    __itt_task_end(itt_domain);
#endif
}

void OperatorBase::release() {
    closeImpl();
    for (auto& child : children)
        child->close();
}

void OperatorBase::describe(std::ostream&) const { }

void OperatorBase::addChild(std::shared_ptr<OperatorBase> child) {
    if (!child)
        throw std::runtime_error("Operator " + name + " received an empty child operator");
    children.push_back(child);
}

std::unique_ptr<Block> OperatorBase::allocateBlock() {
    return std::make_unique<Block>(*budget, context.getBlockCapacity());
}

Partition OperatorBase::createPartition(const std::string& suffix) {
    return context.getTempStore().createPartition(name + "-" + suffix, *budget, context.getBlockCapacity(), stats.io);
}
