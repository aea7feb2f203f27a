#pragma once

#include "../core/types.hpp"

#include <pthread.h>
#include <time.h>

namespace mixCore::platform::impl_posix {

struct critical_section {
    mutable pthread_mutex_t mtx = PTHREAD_MUTEX_INITIALIZER;
    void enter() const noexcept { (void)pthread_mutex_lock(&mtx); }
    void exit() const noexcept { (void)pthread_mutex_unlock(&mtx); }
};

inline timestamp_t get_system_time_us() noexcept {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_t>(ts.tv_sec) * 1000000ULL + static_cast<timestamp_t>(ts.tv_nsec / 1000);
}

/* logging provided centrally by platform.hpp */

} // namespace mixCore::platform::impl_posix
