#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bindery_rx

#include <memory>

namespace bindery_rx {

class Subscription;

template<typename T> class Observer;
template<typename T> class Observable;
template<typename T> class Subject;
template<typename T> class BehaviorSubject;

template<typename T> using ObserverPtr = std::shared_ptr<Observer<T>>;
template<typename T> using ObservablePtr = std::shared_ptr<Observable<T>>;

class ExecutionContext;
class InlineExecutionContext;
class QueuedExecutionContext;
class ScopedExecutionContext;

using ExecutionContextPtr = std::shared_ptr<ExecutionContext>;

} // namespace bindery_rx
