/// @file execution_context.cpp
/// @brief Execution context implementations for bindery_rx

#include <bindery/rx/execution_context.hpp>

namespace bindery_rx {

// =============================================================================
// ExecutionContext
// =============================================================================

namespace {

ExecutionContextPtr& thread_current() {
    thread_local ExecutionContextPtr s_current;
    return s_current;
}

} // anonymous namespace

ExecutionContextPtr ExecutionContext::current() {
    return thread_current();
}

void ExecutionContext::set_current(ExecutionContextPtr context) {
    thread_current() = std::move(context);
}

// =============================================================================
// InlineExecutionContext
// =============================================================================

void InlineExecutionContext::post(Work work) {
    if (work) {
        work();
    }
}

// =============================================================================
// QueuedExecutionContext
// =============================================================================

void QueuedExecutionContext::post(Work work) {
    if (!work) return;

    std::lock_guard lock(m_mutex);
    m_queue.push_back(std::move(work));
}

std::size_t QueuedExecutionContext::run_pending(std::size_t max_items) {
    std::size_t count = 0;
    while (count < max_items && run_one()) {
        ++count;
    }
    return count;
}

bool QueuedExecutionContext::run_one() {
    Work work;
    {
        std::lock_guard lock(m_mutex);
        m_owner = std::this_thread::get_id();
        if (m_queue.empty()) {
            return false;
        }
        work = std::move(m_queue.front());
        m_queue.pop_front();
    }

    // Run outside the lock so work may post more work
    work();
    return true;
}

std::size_t QueuedExecutionContext::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_queue.size();
}

std::thread::id QueuedExecutionContext::owner_thread() const {
    std::lock_guard lock(m_mutex);
    return m_owner;
}

void QueuedExecutionContext::clear() {
    std::lock_guard lock(m_mutex);
    m_queue.clear();
}

// =============================================================================
// ScopedExecutionContext
// =============================================================================

ScopedExecutionContext::ScopedExecutionContext(ExecutionContextPtr context)
    : m_previous(ExecutionContext::current()) {
    ExecutionContext::set_current(std::move(context));
}

ScopedExecutionContext::~ScopedExecutionContext() {
    ExecutionContext::set_current(std::move(m_previous));
}

} // namespace bindery_rx
