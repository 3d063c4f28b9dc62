/// @file subscription_director.cpp
/// @brief Listen/emit subscription management for bindery_bind

#include <bindery/bind/subscription_director.hpp>
#include <bindery/bind/settings.hpp>
#include <bindery/core/log.hpp>
#include <bindery/core/value.hpp>
#include <bindery/model/object.hpp>
#include <bindery/rx/operators.hpp>
#include <bindery/ui/object.hpp>
#include <bindery/ui/property_observer.hpp>

namespace bindery_bind {

using bindery_core::BindError;
using bindery_core::Error;
using bindery_core::Value;
using bindery_core::ValueKind;

// =============================================================================
// TargetSlot
// =============================================================================

std::string TargetSlot::describe() const {
    auto target = object.lock();
    std::string owner = target ? target->name() : std::string("<released>");
    std::string name = property ? property->name() : std::string("<none>");
    return owner + "." + name;
}

// =============================================================================
// SubscriptionDirector
// =============================================================================

namespace {

/// Marks the calling thread in `slot` for its lifetime
class ThreadMark {
public:
    explicit ThreadMark(std::atomic<std::thread::id>& slot)
        : m_slot(slot)
        , m_previous(slot.exchange(std::this_thread::get_id())) {}

    ~ThreadMark() { m_slot.store(m_previous); }

    ThreadMark(const ThreadMark&) = delete;
    ThreadMark& operator=(const ThreadMark&) = delete;

private:
    std::atomic<std::thread::id>& m_slot;
    std::thread::id m_previous;
};

bool marked(const std::atomic<std::thread::id>& slot) {
    return slot.load() == std::this_thread::get_id();
}

} // anonymous namespace

SubscriptionDirector::SubscriptionDirector()
    : m_stats(std::make_shared<Shared>()) {}

SubscriptionDirector::~SubscriptionDirector() {
    teardown();
}

bindery_core::Result<void> SubscriptionDirector::setup(const bindery_model::ObjectPtr& endpoint,
                                                      const TargetSlot& slot, BindingMode mode,
                                                      bindery_rx::ExecutionContextPtr context) {
    teardown();

    if (listens(mode)) {
        auto result = setup_listen(endpoint, slot, mode, std::move(context));
        if (!result) {
            teardown();
            return result;
        }
    }

    if (emits(mode)) {
        setup_emit(endpoint, slot);
    }

    return bindery_core::Ok();
}

bindery_core::Result<void> SubscriptionDirector::setup_listen(const bindery_model::ObjectPtr& endpoint,
                                                             const TargetSlot& slot, BindingMode mode,
                                                             bindery_rx::ExecutionContextPtr context) {
    auto logger = bindery_core::bind_logger();

    auto target = slot.lock();
    if (!endpoint || !target || !slot.property) {
        return bindery_core::Err(Error(BindError::invalid_target("listen setup without endpoint or target")));
    }

    auto capabilities = endpoint->observable_capabilities();
    if (capabilities.size() != 1) {
        return bindery_core::Err(Error(BindError::observable_capability(endpoint->type_name(), capabilities.size())));
    }
    auto* capability = capabilities.front();

    ValueKind element_kind = capability->element_kind();
    ValueKind declared_kind = slot.property->value_kind();
    bool coerce_to_text = declared_kind == ValueKind::String && element_kind != ValueKind::String;

    if (!coerce_to_text && element_kind != declared_kind) {
        return bindery_core::Err(Error(BindError::type_mismatch(slot.describe(),
            bindery_core::value_kind_name(declared_kind),
            bindery_core::value_kind_name(element_kind))));
    }

    if (!context) {
        return bindery_core::Err(Error(BindError::no_execution_context(slot.describe())));
    }

    if (m_listen) {
        m_listen.dispose();
    }

    auto stream = capability->value_stream();

    // Elements pushed back synchronously while forwarding a slot change
    auto shared = m_stats;
    stream = bindery_rx::filter(stream, [shared](const Value&) { return !marked(shared->emitting); });

    if (mode == BindingMode::OneTime) {
        stream = bindery_rx::take(stream, 1);
    }

    if (coerce_to_text) {
        stream = bindery_rx::map(stream, [](const Value& value) {
            return Value{std::in_place_type<std::string>, bindery_core::to_text(value)};
        });
    }

    stream = bindery_rx::observe_on(stream, std::move(context));

    std::weak_ptr<bindery_ui::UiObject> weak_target = target;
    auto property = slot.property;
    bool trace = trace_writes_enabled();

    m_listen = stream->subscribe([weak_target, property, shared, trace](const Value& value) {
        auto target = weak_target.lock();
        if (!target) return;

        bindery_core::Result<void> result;
        {
            ThreadMark mark(shared->writing);
            result = target->set_value(*property, value);
        }
        if (!result) {
            bindery_core::bind_logger()->warn("Dropped write to '{}.{}': {}",
                target->name(), property->name(), result.error().message());
            return;
        }

        shared->writes.fetch_add(1, std::memory_order_relaxed);
        if (trace) {
            bindery_core::bind_logger()->trace("{}.{} <- {}", target->name(), property->name(),
                                               bindery_core::describe(value));
        }
    });

    logger->debug("Listening '{}' -> '{}' ({}{})", endpoint->type_name(), slot.describe(),
                  binding_mode_name(mode), coerce_to_text ? ", as text" : "");
    return bindery_core::Ok();
}

bool SubscriptionDirector::setup_emit(const bindery_model::ObjectPtr& endpoint, const TargetSlot& slot) {
    auto logger = bindery_core::bind_logger();

    auto target = slot.lock();
    if (!endpoint || !target || !slot.property) {
        return false;
    }

    if (!slot.property->is_owner_instance(*target)) {
        logger->debug("Emit skipped for '{}': target is not a {}", slot.describe(), slot.property->owner_name());
        return false;
    }

    bindery_model::ObserverCapability* match = nullptr;
    for (auto* capability : endpoint->observer_capabilities()) {
        if (capability->accepted_kind() == slot.property->value_kind()) {
            match = capability;
            break;
        }
    }

    if (!match) {
        logger->debug("Emit skipped for '{}': endpoint '{}' has no {} observer", slot.describe(),
                      endpoint->type_name(), bindery_core::value_kind_name(slot.property->value_kind()));
        return false;
    }

    if (m_emit) {
        m_emit.dispose();
    }

    auto sink = match->value_observer();
    auto shared = m_stats;

    m_emit = bindery_ui::observe_property(target, slot.property)->subscribe([sink, shared](const Value& value) {
        if (marked(shared->writing)) return;

        ThreadMark mark(shared->emitting);
        shared->emitted.fetch_add(1, std::memory_order_relaxed);
        sink->on_next(value);
    });

    logger->debug("Emitting '{}' -> '{}'", slot.describe(), endpoint->type_name());
    return true;
}

void SubscriptionDirector::teardown() noexcept {
    m_listen.dispose();
    m_emit.dispose();
}

} // namespace bindery_bind
