#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "event_types.hpp"

#include <etl/delegate.h>

namespace mixCore::events {

class Iowner;

// Record handed to every handler of a triggered event.
// A handler sets `handled` to stop delivery to the handlers after it.
struct event {
    event_name_t name;
    Iowner* sender{nullptr};
    bool handled{false};
    timestamp_t ts{0};
    payload_t data;

    event() = default;
    // An over-long name is left empty rather than truncated
    static event make(const char* event_name) noexcept {
        event evt;
        if (fits_capacity<config::event_name_length>(event_name)) { evt.name.assign(event_name); }
        return evt;
    }
};

// Handler signature. etl::delegate compares equal only for the same
// object and the same function, which is what unsubscribe matches on.
using handler_t = etl::delegate<void(event&)>;

} // namespace mixCore::events
