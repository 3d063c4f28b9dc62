#pragma once

/// @file observable.hpp
/// @brief Push-based streams for bindery_rx
///
/// Provides:
/// - Observer<T> / Observable<T> interfaces
/// - Subject<T> (multicast, hot)
/// - BehaviorSubject<T> (multicast, replays its current value)
/// - make_observer / make_observable helpers

#include "fwd.hpp"
#include "subscription.hpp"
#include <bindery/core/error.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace bindery_rx {

// =============================================================================
// Observer
// =============================================================================

/// Receiver side of a stream
template<typename T>
class Observer {
public:
    virtual ~Observer() = default;

    virtual void on_next(const T& value) = 0;
    virtual void on_error(const bindery_core::Error& error) { (void)error; }
    virtual void on_completed() {}
};

/// Observer built from callables
template<typename T>
class LambdaObserver : public Observer<T> {
public:
    using NextFunc = std::function<void(const T&)>;
    using ErrorFunc = std::function<void(const bindery_core::Error&)>;
    using CompletedFunc = std::function<void()>;

    explicit LambdaObserver(NextFunc on_next, ErrorFunc on_error = nullptr,
                            CompletedFunc on_completed = nullptr)
        : m_on_next(std::move(on_next))
        , m_on_error(std::move(on_error))
        , m_on_completed(std::move(on_completed)) {}

    void on_next(const T& value) override {
        if (m_on_next) m_on_next(value);
    }

    void on_error(const bindery_core::Error& error) override {
        if (m_on_error) m_on_error(error);
    }

    void on_completed() override {
        if (m_on_completed) m_on_completed();
    }

private:
    NextFunc m_on_next;
    ErrorFunc m_on_error;
    CompletedFunc m_on_completed;
};

template<typename T>
[[nodiscard]] ObserverPtr<T> make_observer(
    std::function<void(const T&)> on_next,
    std::function<void(const bindery_core::Error&)> on_error = nullptr,
    std::function<void()> on_completed = nullptr) {
    return std::make_shared<LambdaObserver<T>>(std::move(on_next), std::move(on_error),
                                               std::move(on_completed));
}

// =============================================================================
// Observable
// =============================================================================

/// Source side of a stream
template<typename T>
class Observable {
public:
    virtual ~Observable() = default;

    /// Attach an observer; the returned handle detaches it
    [[nodiscard]] virtual Subscription subscribe(ObserverPtr<T> observer) = 0;

    /// Attach a callable as observer
    [[nodiscard]] Subscription subscribe(std::function<void(const T&)> on_next) {
        return subscribe(make_observer<T>(std::move(on_next)));
    }
};

/// Observable whose subscribe behaviour is a callable
template<typename T>
class AnonymousObservable : public Observable<T> {
public:
    using SubscribeFunc = std::function<Subscription(ObserverPtr<T>)>;

    explicit AnonymousObservable(SubscribeFunc on_subscribe)
        : m_on_subscribe(std::move(on_subscribe)) {}

    using Observable<T>::subscribe;

    [[nodiscard]] Subscription subscribe(ObserverPtr<T> observer) override {
        return m_on_subscribe(std::move(observer));
    }

private:
    SubscribeFunc m_on_subscribe;
};

/// Create a cold observable; on_subscribe runs once per subscription
template<typename T>
[[nodiscard]] ObservablePtr<T> make_observable(
    typename AnonymousObservable<T>::SubscribeFunc on_subscribe) {
    return std::make_shared<AnonymousObservable<T>>(std::move(on_subscribe));
}

// =============================================================================
// Subject
// =============================================================================

/// Hot multicast stream. Subscriptions hold the subject state weakly, so a
/// subscription may outlive the subject.
template<typename T>
class Subject : public Observable<T>, public Observer<T> {
public:
    Subject() : m_state(std::make_shared<State>()) {}
    ~Subject() override = default;

    Subject(const Subject&) = delete;
    Subject& operator=(const Subject&) = delete;

    using Observable<T>::subscribe;

    [[nodiscard]] Subscription subscribe(ObserverPtr<T> observer) override {
        if (!observer) return {};

        std::uint64_t id = 0;
        bool completed = false;
        {
            std::lock_guard lock(m_state->mutex);
            completed = m_state->completed;
            if (!completed) {
                id = m_state->next_id++;
                m_state->observers.emplace(id, observer);
            }
        }

        // Completed subjects answer late subscribers immediately
        if (completed) {
            observer->on_completed();
            return {};
        }

        on_subscribed(*observer);

        std::weak_ptr<State> weak = m_state;
        return Subscription([weak, id]() {
            if (auto state = weak.lock()) {
                std::lock_guard lock(state->mutex);
                state->observers.erase(id);
            }
        });
    }

    void on_next(const T& value) override {
        for (auto& observer : snapshot()) {
            observer->on_next(value);
        }
    }

    void on_error(const bindery_core::Error& error) override {
        auto observers = snapshot();
        finish();
        for (auto& observer : observers) {
            observer->on_error(error);
        }
    }

    void on_completed() override {
        auto observers = snapshot();
        finish();
        for (auto& observer : observers) {
            observer->on_completed();
        }
    }

    /// Number of attached observers
    [[nodiscard]] std::size_t observer_count() const {
        std::lock_guard lock(m_state->mutex);
        return m_state->observers.size();
    }

    [[nodiscard]] bool has_observers() const { return observer_count() > 0; }

    [[nodiscard]] bool is_completed() const {
        std::lock_guard lock(m_state->mutex);
        return m_state->completed;
    }

protected:
    /// Hook run after an observer was attached, outside the observer-list lock
    virtual void on_subscribed(Observer<T>& observer) { (void)observer; }

private:
    struct State {
        mutable std::mutex mutex;
        std::map<std::uint64_t, ObserverPtr<T>> observers;
        std::uint64_t next_id{1};
        bool completed{false};
    };

    std::vector<ObserverPtr<T>> snapshot() const {
        std::vector<ObserverPtr<T>> result;
        std::lock_guard lock(m_state->mutex);
        if (m_state->completed) return result;
        result.reserve(m_state->observers.size());
        for (const auto& [id, observer] : m_state->observers) {
            result.push_back(observer);
        }
        return result;
    }

    void finish() {
        std::lock_guard lock(m_state->mutex);
        m_state->completed = true;
        m_state->observers.clear();
    }

    std::shared_ptr<State> m_state;
};

// =============================================================================
// BehaviorSubject
// =============================================================================

/// Subject that holds a current value and replays it to each new subscriber.
/// Replay and on_next are serialized, so a subscriber never receives the
/// replayed value after a newer one.
template<typename T>
class BehaviorSubject : public Subject<T> {
public:
    explicit BehaviorSubject(T initial = T{}) : m_value(std::move(initial)) {}

    using Subject<T>::subscribe;

    [[nodiscard]] Subscription subscribe(ObserverPtr<T> observer) override {
        std::lock_guard lock(m_mutex);
        return Subject<T>::subscribe(std::move(observer));
    }

    /// Current value
    [[nodiscard]] T value() const {
        std::lock_guard lock(m_mutex);
        return m_value;
    }

    void on_next(const T& value) override {
        std::lock_guard lock(m_mutex);
        m_value = value;
        Subject<T>::on_next(value);
    }

    void on_error(const bindery_core::Error& error) override {
        std::lock_guard lock(m_mutex);
        Subject<T>::on_error(error);
    }

    void on_completed() override {
        std::lock_guard lock(m_mutex);
        Subject<T>::on_completed();
    }

protected:
    // Runs under m_mutex
    void on_subscribed(Observer<T>& observer) override {
        observer.on_next(m_value);
    }

private:
    // Recursive: observers may read or push the subject while it delivers
    mutable std::recursive_mutex m_mutex;
    T m_value;
};

} // namespace bindery_rx
