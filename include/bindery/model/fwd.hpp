#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bindery_model

#include <memory>

namespace bindery_model {

class Object;
class DynamicObject;
class ObservableCapability;
class ObserverCapability;

template<typename T> class Endpoint;
template<typename T> class ObservableProperty;

using ObjectPtr = std::shared_ptr<Object>;

} // namespace bindery_model
