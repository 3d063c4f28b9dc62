#pragma once

/// @file execution_context.hpp
/// @brief Execution contexts that serialize delivery onto one owner thread
///
/// An ExecutionContext accepts work from any thread and runs it in posting
/// order on the thread that owns it. Each thread may nominate a current
/// context, which operators capture when a subscription is made.

#include "fwd.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>

namespace bindery_rx {

using Work = std::function<void()>;

// =============================================================================
// ExecutionContext
// =============================================================================

/// Abstract execution context
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    /// Schedule work; items run in posting order
    virtual void post(Work work) = 0;

    /// Context nominated for the calling thread, or null
    [[nodiscard]] static ExecutionContextPtr current();

    /// Nominate a context for the calling thread (null clears it)
    static void set_current(ExecutionContextPtr context);
};

// =============================================================================
// InlineExecutionContext
// =============================================================================

/// Runs work immediately on the posting thread
class InlineExecutionContext : public ExecutionContext {
public:
    void post(Work work) override;
};

// =============================================================================
// QueuedExecutionContext
// =============================================================================

/// Thread-safe FIFO drained explicitly by its owner thread (the UI loop)
class QueuedExecutionContext : public ExecutionContext {
public:
    QueuedExecutionContext() = default;

    QueuedExecutionContext(const QueuedExecutionContext&) = delete;
    QueuedExecutionContext& operator=(const QueuedExecutionContext&) = delete;

    void post(Work work) override;

    /// Run queued work, including work posted while draining
    /// @param max_items Upper bound on items run by this call
    /// @return Number of items run
    std::size_t run_pending(std::size_t max_items = std::numeric_limits<std::size_t>::max());

    /// Run exactly one item if available
    bool run_one();

    /// Number of queued items
    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] bool has_pending() const { return pending_count() > 0; }

    /// Thread that last drained this context
    [[nodiscard]] std::thread::id owner_thread() const;

    /// Drop all queued work without running it
    void clear();

private:
    mutable std::mutex m_mutex;
    std::deque<Work> m_queue;
    std::thread::id m_owner;
};

// =============================================================================
// ScopedExecutionContext
// =============================================================================

/// RAII nomination of the current context for the calling thread
class ScopedExecutionContext {
public:
    explicit ScopedExecutionContext(ExecutionContextPtr context);
    ~ScopedExecutionContext();

    ScopedExecutionContext(const ScopedExecutionContext&) = delete;
    ScopedExecutionContext& operator=(const ScopedExecutionContext&) = delete;

private:
    ExecutionContextPtr m_previous;
};

} // namespace bindery_rx
