#pragma once

#include "../core/types.hpp"

namespace mixCore::platform::impl_generic {

// Single-threaded targets: nothing to guard
struct critical_section {
    void enter() const noexcept {}
    void exit() const noexcept {}
};

inline timestamp_t get_system_time_us() noexcept {
    static timestamp_t counter = 0;
    return ++counter; // monotonic stub
}

/* logging provided centrally by platform.hpp */

} // namespace mixCore::platform::impl_generic
