/// @file main.cpp
/// @brief Scoreboard Demo
///
/// Binds a small widget tree to a view model whose values are produced on a
/// worker thread, then drains the UI queue on the main thread. Swapping the
/// view model half way shows bindings following the context object.
///
/// Usage: scoreboard_demo [settings.json]

#include <bindery/bind/bind.hpp>
#include <bindery/core/log.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace {

class Label : public bindery_ui::UiElement {
public:
    using UiElement::UiElement;

    static inline const bindery_ui::PropertyPtr TextProperty =
        bindery_ui::PropertyDescriptor::register_property<Label, std::string>("Text", "");
};

class Slider : public bindery_ui::UiElement {
public:
    using UiElement::UiElement;

    static inline const bindery_ui::PropertyPtr ValueProperty =
        bindery_ui::PropertyDescriptor::register_property<Slider, double>("Value", 0.0, true);
};

struct Player {
    std::shared_ptr<bindery_model::DynamicObject> object;
    std::shared_ptr<bindery_model::ObservableProperty<std::int32_t>> score;
    std::shared_ptr<bindery_model::ObservableProperty<double>> volume;
};

Player make_player(const std::string& name) {
    Player player;
    player.object = bindery_model::make_object("PlayerViewModel");
    player.score = bindery_model::make_property<std::int32_t>(0);
    player.volume = bindery_model::make_property<double>(0.5);

    auto stats = bindery_model::make_object("PlayerStats");
    stats->set_member("Score", player.score);

    player.object->set_member("Stats", stats);
    player.object->set_member("Volume", player.volume);
    spdlog::info("Created view model for {}", name);
    return player;
}

void drain(bindery_rx::QueuedExecutionContext& ui, const std::shared_ptr<Label>& label) {
    auto ran = ui.run_pending();
    if (ran > 0) {
        spdlog::info("UI ran {} update(s), label = '{}'", ran, label->get<std::string>(*Label::TextProperty));
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    bindery_core::init_logging();

    if (argc > 1) {
        auto settings = bindery_bind::load_settings(argv[1]);
        if (!settings) {
            spdlog::error("Failed to load settings: {}", bindery_core::build_error_chain(settings.error()));
            return 1;
        }
        bindery_bind::apply_settings(settings.value());
    }

    auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();
    bindery_rx::ScopedExecutionContext ui_scope(ui);

    auto window = bindery_ui::make_ui<bindery_ui::UiElement>("Window");
    auto label = bindery_ui::make_ui<Label>("ScoreLabel");
    auto slider = bindery_ui::make_ui<Slider>("VolumeSlider");
    window->add_logical_child(label);
    window->add_logical_child(slider);

    auto score_binding = bindery_bind::bind(label, Label::TextProperty, "Stats.Score", bindery_bind::BindingMode::OneWay);
    if (!score_binding) {
        spdlog::error("Score binding failed: {}", score_binding.error().message());
        return 1;
    }

    auto volume_binding = bindery_bind::bind(slider, Slider::ValueProperty, "Volume");
    if (!volume_binding) {
        spdlog::error("Volume binding failed: {}", volume_binding.error().message());
        return 1;
    }

    auto alice = make_player("alice");
    auto bob = make_player("bob");

    window->set_context(alice.object);
    drain(*ui, label);

    std::thread producer([&alice]() {
        for (std::int32_t i = 1; i <= 5; ++i) {
            alice.score->set(i * 10);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    producer.join();
    drain(*ui, label);

    slider->set_value(*Slider::ValueProperty, bindery_core::Value{0.8}).unwrap();
    spdlog::info("Slider moved, alice volume = {}", alice.volume->value());

    window->set_context(bob.object);
    bob.score->set(7);
    drain(*ui, label);

    alice.score->set(999);
    drain(*ui, label);
    spdlog::info("Label after alice changed off-screen: '{}'", label->get<std::string>(*Label::TextProperty));

    spdlog::info("Score binding: {} ({} writes)",
                 bindery_bind::directive_state_name(score_binding.value()->state()),
                 score_binding.value()->director().writes_applied());
    spdlog::info("Volume binding mode: {}", bindery_bind::binding_mode_name(volume_binding.value()->mode()));

    bindery_core::shutdown_logging();
    return 0;
}
