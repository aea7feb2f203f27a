#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../event/event.hpp"
#include "../event/event_types.hpp"

#include <etl/variant.h>
#include <etl/vector.h>

namespace mixCore::behaviors {

using events::event_name_t;
using events::handler_t;

// Name of a handler method on the declaring behavior
using method_name_t = string<config::method_name_length>;

/**
 * @brief Declared, not yet resolved reference to the code run for an event
 *
 * Either the name of a method on the declaring behavior (resolved and bound
 * to that instance at attach time) or a ready delegate: an object+method
 * pair, a free function or a lambda that outlives the attachment.
 */
class handler_descriptor {
public:
    using storage_t = etl::variant<method_name_t, handler_t>;

    handler_descriptor() noexcept : value_(handler_t()) {}

    // Implicit so event maps can list delegates directly
    handler_descriptor(const handler_t& fn) noexcept : value_(fn) {} // NOLINT(google-explicit-constructor)

    // A name too long for method_name_t stays an empty delegate, which
    // attach() reports as unresolved_handler
    static handler_descriptor method(const char* name) noexcept {
        handler_descriptor desc;
        if (fits_capacity<config::method_name_length>(name)) {
            desc.value_ = method_name_t(name);
        }
        return desc;
    }

    static handler_descriptor callable(const handler_t& fn) noexcept {
        return handler_descriptor(fn);
    }

    [[nodiscard]] bool is_method() const noexcept { return etl::holds_alternative<method_name_t>(value_); }
    [[nodiscard]] bool is_callable() const noexcept { return etl::holds_alternative<handler_t>(value_); }

    const method_name_t& method_name() const noexcept { return etl::get<method_name_t>(value_); }
    const handler_t& function() const noexcept { return etl::get<handler_t>(value_); }

private:
    storage_t value_;
};

// One entry of a behavior's events() declaration
struct event_binding {
    event_name_t event;
    handler_descriptor handler;

    event_binding() = default;
    // An over-long event name is left empty; attach() rejects it with
    // invalid_parameter
    event_binding(const char* event_name, const handler_descriptor& desc) noexcept
        : handler(desc) {
        if (fits_capacity<config::event_name_length>(event_name)) { event.assign(event_name); }
    }
};

// Declaration order is the subscription order. Holds at most
// MIXCORE_MAX_BEHAVIOR_EVENTS bindings.
using event_map = etl::vector<event_binding, config::max_behavior_events>;

} // namespace mixCore::behaviors
