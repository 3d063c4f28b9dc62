#pragma once

/// @file bind.hpp
/// @brief Main include header for bindery_bind
///
/// bindery_bind connects observable endpoints on a context object to typed
/// property slots on UI objects:
/// - PropertyPath / resolve_path for dotted member paths
/// - SubscriptionDirector for the listen and emit directions
/// - BindingDirective for context-following bindings
/// - BinderySettings for JSON configuration
///
/// ## Quick Start
///
/// ```cpp
/// auto ui = std::make_shared<bindery_rx::QueuedExecutionContext>();
/// bindery_rx::ScopedExecutionContext scope(ui);
///
/// auto score = bindery_model::make_property<std::int32_t>(0);
/// auto vm = bindery_model::make_object("GameViewModel");
/// vm->set_member("Score", score);
///
/// auto window = bindery_ui::make_ui<bindery_ui::UiElement>("Window");
/// auto label = bindery_ui::make_ui<Label>("ScoreLabel");
/// window->add_logical_child(label);
/// window->set_context(vm);
///
/// auto directive = bindery_bind::bind(label, Label::TextProperty, "Score");
///
/// score->set(42);
/// ui->run_pending();   // label text is now "42"
/// ```

#include "directive.hpp"
#include "path.hpp"
#include "settings.hpp"
#include "subscription_director.hpp"
#include "types.hpp"

#include <bindery/model/endpoint.hpp>
#include <bindery/model/object.hpp>
#include <bindery/rx/execution_context.hpp>
#include <bindery/ui/context_locator.hpp>
#include <bindery/ui/object.hpp>
#include <bindery/ui/property_observer.hpp>
