#pragma once

/// @file operators.hpp
/// @brief Stream operators for bindery_rx (take, map, filter, observe_on)

#include "observable.hpp"
#include "execution_context.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>

namespace bindery_rx {

// =============================================================================
// take
// =============================================================================

/// Forward the first `count` elements, then complete and detach upstream
template<typename T>
[[nodiscard]] ObservablePtr<T> take(ObservablePtr<T> source, std::size_t count) {
    return make_observable<T>([source, count](ObserverPtr<T> downstream) -> Subscription {
        if (count == 0) {
            downstream->on_completed();
            return {};
        }

        struct State {
            std::mutex mutex;
            std::size_t remaining = 0;
            bool done = false;
            Subscription upstream;

            // Marks the stream finished; returns false if it already was
            bool finish() {
                std::lock_guard lock(mutex);
                if (done) return false;
                done = true;
                return true;
            }

            void release_upstream() {
                Subscription up;
                {
                    std::lock_guard lock(mutex);
                    up = std::move(upstream);
                }
                up.dispose();
            }
        };

        auto state = std::make_shared<State>();
        state->remaining = count;

        auto upstream = source->subscribe(make_observer<T>(
            [state, downstream](const T& value) {
                bool last = false;
                {
                    std::lock_guard lock(state->mutex);
                    if (state->done) return;
                    last = (--state->remaining == 0);
                    if (last) state->done = true;
                }
                downstream->on_next(value);
                if (last) {
                    downstream->on_completed();
                    state->release_upstream();
                }
            },
            [state, downstream](const bindery_core::Error& error) {
                if (state->finish()) downstream->on_error(error);
            },
            [state, downstream]() {
                if (state->finish()) downstream->on_completed();
            }));

        bool finished_early = false;
        {
            std::lock_guard lock(state->mutex);
            finished_early = state->done;
            if (!finished_early) {
                state->upstream = std::move(upstream);
            }
        }
        // Sources that replay on subscribe may finish before subscribe returns
        if (finished_early) {
            upstream.dispose();
        }

        return Subscription([state]() {
            state->finish();
            state->release_upstream();
        });
    });
}

// =============================================================================
// map
// =============================================================================

/// Transform each element
template<typename T, typename F, typename U = std::invoke_result_t<F, const T&>>
[[nodiscard]] ObservablePtr<U> map(ObservablePtr<T> source, F func) {
    return make_observable<U>([source, func](ObserverPtr<U> downstream) -> Subscription {
        return source->subscribe(make_observer<T>(
            [func, downstream](const T& value) { downstream->on_next(func(value)); },
            [downstream](const bindery_core::Error& error) { downstream->on_error(error); },
            [downstream]() { downstream->on_completed(); }));
    });
}

// =============================================================================
// filter
// =============================================================================

/// Forward only elements for which `predicate` returns true
template<typename T, typename P>
[[nodiscard]] ObservablePtr<T> filter(ObservablePtr<T> source, P predicate) {
    return make_observable<T>([source, predicate](ObserverPtr<T> downstream) -> Subscription {
        return source->subscribe(make_observer<T>(
            [predicate, downstream](const T& value) {
                if (predicate(value)) downstream->on_next(value);
            },
            [downstream](const bindery_core::Error& error) { downstream->on_error(error); },
            [downstream]() { downstream->on_completed(); }));
    });
}

// =============================================================================
// observe_on
// =============================================================================

/// Deliver every notification through `context`, in arrival order.
/// Notifications still queued when the subscription is disposed are dropped.
template<typename T>
[[nodiscard]] ObservablePtr<T> observe_on(ObservablePtr<T> source, ExecutionContextPtr context) {
    return make_observable<T>([source, context](ObserverPtr<T> downstream) -> Subscription {
        auto alive = std::make_shared<std::atomic<bool>>(true);

        auto upstream = std::make_shared<Subscription>(source->subscribe(make_observer<T>(
            [alive, context, downstream](const T& value) {
                context->post([alive, downstream, value]() {
                    if (alive->load(std::memory_order_acquire)) downstream->on_next(value);
                });
            },
            [alive, context, downstream](const bindery_core::Error& error) {
                context->post([alive, downstream, error]() {
                    if (alive->load(std::memory_order_acquire)) downstream->on_error(error);
                });
            },
            [alive, context, downstream]() {
                context->post([alive, downstream]() {
                    if (alive->load(std::memory_order_acquire)) downstream->on_completed();
                });
            })));

        return Subscription([alive, upstream]() {
            alive->store(false, std::memory_order_release);
            upstream->dispose();
        });
    });
}

} // namespace bindery_rx
