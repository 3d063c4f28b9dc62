/// @file test_subscription_director.cpp
/// @brief Tests for listen/emit subscription management

#include <catch2/catch.hpp>
#include <bindery/bind/subscription_director.hpp>
#include <bindery/model/endpoint.hpp>
#include <bindery/ui/object.hpp>

#include <thread>
#include <vector>

using namespace bindery_bind;
using bindery_core::BindError;
using bindery_core::Value;

namespace {

class Display : public bindery_ui::UiElement {
public:
    using UiElement::UiElement;

    static inline const bindery_ui::PropertyPtr CountProperty =
        bindery_ui::PropertyDescriptor::register_property<Display, std::int32_t>("Count", 0);
    static inline const bindery_ui::PropertyPtr TextProperty =
        bindery_ui::PropertyDescriptor::register_property<Display, std::string>("Text", "");
    static inline const bindery_ui::PropertyPtr RatioProperty =
        bindery_ui::PropertyDescriptor::register_property<Display, double>("Ratio", 0.0);
};

/// Object with two observable sides
class SplitSource : public bindery_model::Object {
public:
    SplitSource()
        : m_left(bindery_model::make_property<std::int32_t>(1))
        , m_right(bindery_model::make_property<std::int32_t>(2)) {}

    std::vector<bindery_model::ObservableCapability*> observable_capabilities() override {
        return {m_left.get(), m_right.get()};
    }

private:
    std::shared_ptr<bindery_model::ObservableProperty<std::int32_t>> m_left;
    std::shared_ptr<bindery_model::ObservableProperty<std::int32_t>> m_right;
};

} // anonymous namespace

TEST_CASE("SubscriptionDirector: OneWay delivers in order on the context", "[bind][director]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto subject = std::make_shared<bindery_rx::Subject<std::int32_t>>();
    auto endpoint = bindery_model::make_endpoint<std::int32_t>(subject);
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();

    std::vector<std::int32_t> written;
    std::vector<std::thread::id> writer_threads;
    display->add_value_changed(*Display::CountProperty, [&](const bindery_ui::UiObject& sender) {
        written.push_back(sender.get<std::int32_t>(*Display::CountProperty));
        writer_threads.push_back(std::this_thread::get_id());
    });

    SubscriptionDirector director;
    TargetSlot slot{display, Display::CountProperty};
    REQUIRE(director.setup(endpoint, slot, BindingMode::OneWay, ui).is_ok());
    REQUIRE(director.has_listen());
    REQUIRE_FALSE(director.has_emit());

    std::thread producer([&subject]() {
        subject->on_next(1);
        subject->on_next(2);
        subject->on_next(3);
    });
    producer.join();

    REQUIRE(written.empty());
    REQUIRE(ui->pending_count() == 3);

    ui->run_pending();
    REQUIRE(written == std::vector<std::int32_t>{1, 2, 3});
    REQUIRE(display->get<std::int32_t>(*Display::CountProperty) == 3);
    REQUIRE(director.writes_applied() == 3);
    for (const auto& id : writer_threads) {
        REQUIRE(id == std::this_thread::get_id());
    }
}

TEST_CASE("SubscriptionDirector: OneTime writes once", "[bind][director]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto score = bindery_model::make_property<std::int32_t>(10);
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();

    SubscriptionDirector director;
    REQUIRE(director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::OneTime, ui).is_ok());

    score->set(11);
    score->set(12);
    ui->run_pending();

    REQUIRE(display->get<std::int32_t>(*Display::CountProperty) == 10);
    REQUIRE(director.writes_applied() == 1);
    REQUIRE(score->observer_count() == 0);
}

TEST_CASE("SubscriptionDirector: text slots receive the textual form", "[bind][director]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto inline_context = std::make_shared<bindery_rx::InlineExecutionContext>();
    SubscriptionDirector director;

    SECTION("integers") {
        auto score = bindery_model::make_property<std::int32_t>(42);
        REQUIRE(director.setup(score, TargetSlot{display, Display::TextProperty}, BindingMode::OneWay, inline_context).is_ok());
        REQUIRE(display->get<std::string>(*Display::TextProperty) == "42");

        score->set(-3);
        REQUIRE(display->get<std::string>(*Display::TextProperty) == "-3");
    }

    SECTION("booleans") {
        auto flag = bindery_model::make_property<bool>(true);
        REQUIRE(director.setup(flag, TargetSlot{display, Display::TextProperty}, BindingMode::OneTime, inline_context).is_ok());
        REQUIRE(display->get<std::string>(*Display::TextProperty) == "true");
    }

    SECTION("strings pass through") {
        auto name = bindery_model::make_property<std::string>("Ada");
        REQUIRE(director.setup(name, TargetSlot{display, Display::TextProperty}, BindingMode::OneWay, inline_context).is_ok());
        REQUIRE(display->get<std::string>(*Display::TextProperty) == "Ada");
    }
}

TEST_CASE("SubscriptionDirector: configuration errors", "[bind][director][errors]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();
    SubscriptionDirector director;

    SECTION("no observable capability") {
        auto plain = bindery_model::make_object("Plain");
        auto result = director.setup(plain, TargetSlot{display, Display::CountProperty}, BindingMode::OneWay, ui);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_bind_error(BindError::Kind::ObservableCapability));
        REQUIRE(director.live_count() == 0);
    }

    SECTION("several observable capabilities") {
        auto split = std::make_shared<SplitSource>();
        auto result = director.setup(split, TargetSlot{display, Display::CountProperty}, BindingMode::OneWay, ui);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_bind_error(BindError::Kind::ObservableCapability));
    }

    SECTION("element kind differs from a non-text slot") {
        auto ratio = bindery_model::make_property<float>(0.5f);
        auto result = director.setup(ratio, TargetSlot{display, Display::RatioProperty}, BindingMode::OneWay, ui);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_bind_error(BindError::Kind::TypeMismatch));
        REQUIRE(ratio->observer_count() == 0);
    }

    SECTION("no execution context") {
        auto score = bindery_model::make_property<std::int32_t>(1);
        auto result = director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::OneWay, nullptr);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_bind_error(BindError::Kind::NoExecutionContext));
    }

    SECTION("emit-only bindings need no execution context") {
        auto score = bindery_model::make_property<std::int32_t>(1);
        auto result = director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::OneWayToSource, nullptr);
        REQUIRE(result.is_ok());
        REQUIRE(director.has_emit());
    }
}

TEST_CASE("SubscriptionDirector: emit direction", "[bind][director][emit]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto score = bindery_model::make_property<std::int32_t>(0);
    SubscriptionDirector director;

    std::vector<std::int32_t> received;
    auto probe = score->subject()->subscribe([&received](const std::int32_t& v) { received.push_back(v); });
    received.clear();

    SECTION("slot changes reach the endpoint") {
        REQUIRE(director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::OneWayToSource, nullptr).is_ok());
        REQUIRE_FALSE(director.has_listen());

        REQUIRE(display->set_value(*Display::CountProperty, Value{std::int32_t{4}}).is_ok());
        REQUIRE(display->set_value(*Display::CountProperty, Value{std::int32_t{5}}).is_ok());
        REQUIRE(received == std::vector<std::int32_t>{4, 5});
        REQUIRE(director.values_emitted() == 2);
    }

    SECTION("skipped when the endpoint accepts another kind") {
        auto label = bindery_model::make_property<std::string>("");
        REQUIRE(director.setup(label, TargetSlot{display, Display::CountProperty}, BindingMode::OneWayToSource, nullptr).is_ok());
        REQUIRE_FALSE(director.has_emit());
    }

    SECTION("skipped when the target is not an owner instance") {
        auto stranger = bindery_ui::make_ui<bindery_ui::UiElement>("stranger");
        REQUIRE(director.setup(score, TargetSlot{stranger, Display::CountProperty}, BindingMode::OneWayToSource, nullptr).is_ok());
        REQUIRE_FALSE(director.has_emit());
        REQUIRE(stranger->value_changed_listener_count(*Display::CountProperty) == 0);
    }

    SECTION("skipped for read-only endpoints") {
        auto subject = std::make_shared<bindery_rx::Subject<std::int32_t>>();
        auto readonly = bindery_model::make_endpoint<std::int32_t>(subject);
        REQUIRE_FALSE(director.setup_emit(readonly, TargetSlot{display, Display::CountProperty}));
    }
}

TEST_CASE("SubscriptionDirector: TwoWay without echo", "[bind][director][twoway]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto score = bindery_model::make_property<std::int32_t>(0);
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();

    std::vector<std::int32_t> endpoint_values;
    auto probe = score->subject()->subscribe([&endpoint_values](const std::int32_t& v) { endpoint_values.push_back(v); });
    endpoint_values.clear();

    SubscriptionDirector director;
    REQUIRE(director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::TwoWay, ui).is_ok());
    REQUIRE(director.live_count() == 2);
    ui->run_pending();

    SECTION("local mutation is forwarded exactly once") {
        auto writes_before = director.writes_applied();

        REQUIRE(display->set_value(*Display::CountProperty, Value{std::int32_t{7}}).is_ok());
        REQUIRE(endpoint_values == std::vector<std::int32_t>{7});
        REQUIRE(score->value() == 7);

        REQUIRE_FALSE(ui->has_pending());
        ui->run_pending();
        REQUIRE(director.writes_applied() == writes_before);
        REQUIRE(director.values_emitted() == 1);
    }

    SECTION("endpoint changes are not sent back") {
        score->set(9);
        REQUIRE(endpoint_values == std::vector<std::int32_t>{9});

        ui->run_pending();
        REQUIRE(display->get<std::int32_t>(*Display::CountProperty) == 9);
        REQUIRE(endpoint_values == std::vector<std::int32_t>{9});
        REQUIRE(director.values_emitted() == 0);
    }
}

TEST_CASE("SubscriptionDirector: teardown", "[bind][director][teardown]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto score = bindery_model::make_property<std::int32_t>(1);
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();

    SubscriptionDirector director;
    REQUIRE(director.setup(score, TargetSlot{display, Display::CountProperty}, BindingMode::TwoWay, ui).is_ok());
    REQUIRE(score->observer_count() == 1);
    REQUIRE(display->value_changed_listener_count(*Display::CountProperty) == 1);

    SECTION("releases both directions and is idempotent") {
        director.teardown();
        director.teardown();
        REQUIRE(director.live_count() == 0);
        REQUIRE(score->observer_count() == 0);
        REQUIRE(display->value_changed_listener_count(*Display::CountProperty) == 0);
    }

    SECTION("scheduled writes are dropped") {
        score->set(2);
        REQUIRE(ui->pending_count() == 2);

        director.teardown();
        ui->run_pending();
        REQUIRE(display->get<std::int32_t>(*Display::CountProperty) == 0);
        REQUIRE(director.writes_applied() == 0);
    }

    SECTION("setup again replaces the previous pair") {
        auto other = bindery_model::make_property<std::int32_t>(5);
        REQUIRE(director.setup(other, TargetSlot{display, Display::CountProperty}, BindingMode::OneWay, ui).is_ok());
        REQUIRE(score->observer_count() == 0);
        REQUIRE(other->observer_count() == 1);
        REQUIRE(director.live_count() == 1);
    }

    SECTION("teardown on an empty director") {
        SubscriptionDirector empty;
        empty.teardown();
        REQUIRE(empty.live_count() == 0);
    }

    SECTION("target destroyed before teardown") {
        display.reset();
        score->set(3);
        ui->run_pending();
        director.teardown();
        REQUIRE(director.live_count() == 0);
    }
}

TEST_CASE("SubscriptionDirector: mode table", "[bind][director][mode]") {
    auto display = bindery_ui::make_ui<Display>("display");
    auto score = bindery_model::make_property<std::int32_t>(1);
    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();
    SubscriptionDirector director;

    struct Row {
        BindingMode mode;
        bool listen;
        bool emit;
    };

    for (const auto& row : {Row{BindingMode::OneTime, true, false}, Row{BindingMode::OneWay, true, false},
                            Row{BindingMode::OneWayToSource, false, true}, Row{BindingMode::TwoWay, true, true}}) {
        REQUIRE(director.setup(score, TargetSlot{display, Display::CountProperty}, row.mode, ui).is_ok());
        REQUIRE(director.has_listen() == row.listen);
        REQUIRE(director.has_emit() == row.emit);
    }
}
