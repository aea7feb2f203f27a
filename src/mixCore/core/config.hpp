#pragma once

#include <cstddef>

#include "types.hpp"

// Owner-side handler table capacity (all events of one component combined)
#ifndef MIXCORE_MAX_EVENT_HANDLERS
#define MIXCORE_MAX_EVENT_HANDLERS 32
#endif

// Upper bound on the bindings a single behavior may declare in events()
#ifndef MIXCORE_MAX_BEHAVIOR_EVENTS
#define MIXCORE_MAX_BEHAVIOR_EVENTS 8
#endif

// Named behavior slots per component
#ifndef MIXCORE_MAX_BEHAVIORS
#define MIXCORE_MAX_BEHAVIORS 4
#endif

// Behaviors a component tracks, named or attached directly
#ifndef MIXCORE_MAX_ATTACHED_BEHAVIORS
#define MIXCORE_MAX_ATTACHED_BEHAVIORS 8
#endif

// Fixed string capacities; longer names are rejected, never truncated
#ifndef MIXCORE_EVENT_NAME_LENGTH
#define MIXCORE_EVENT_NAME_LENGTH 32
#endif
#ifndef MIXCORE_METHOD_NAME_LENGTH
#define MIXCORE_METHOD_NAME_LENGTH 32
#endif
#ifndef MIXCORE_BEHAVIOR_NAME_LENGTH
#define MIXCORE_BEHAVIOR_NAME_LENGTH 24
#endif

namespace mixCore::config {

        // Event table configuration
        constexpr size_t max_event_handlers = MIXCORE_MAX_EVENT_HANDLERS;
        constexpr size_t event_name_length = MIXCORE_EVENT_NAME_LENGTH;

        // Behavior configuration
        constexpr size_t max_behavior_events = MIXCORE_MAX_BEHAVIOR_EVENTS;
        constexpr size_t method_name_length = MIXCORE_METHOD_NAME_LENGTH;

        // Component behavior registry
        constexpr size_t max_behaviors = MIXCORE_MAX_BEHAVIORS;
        constexpr size_t behavior_name_length = MIXCORE_BEHAVIOR_NAME_LENGTH;
        constexpr size_t max_attached_behaviors = MIXCORE_MAX_ATTACHED_BEHAVIORS;

        // Debug configuration
        #ifdef MIXCORE_DEBUG
            constexpr bool debug_enabled = true;
        #else
            constexpr bool debug_enabled = false;
        #endif

        // -------- Compile-time sanity checks for flag interrelations --------
        static_assert(max_event_handlers >= 1, "MIXCORE_MAX_EVENT_HANDLERS must be >= 1");
        static_assert(max_behavior_events >= 1, "MIXCORE_MAX_BEHAVIOR_EVENTS must be >= 1");
        static_assert(max_behavior_events <= max_event_handlers,
                      "MIXCORE_MAX_BEHAVIOR_EVENTS must be <= MIXCORE_MAX_EVENT_HANDLERS; a single behavior could never attach");
        static_assert(max_behaviors >= 1, "MIXCORE_MAX_BEHAVIORS must be >= 1");
        static_assert(max_attached_behaviors >= max_behaviors,
                      "MIXCORE_MAX_ATTACHED_BEHAVIORS must be >= MIXCORE_MAX_BEHAVIORS; every named behavior is also tracked");
        static_assert(event_name_length >= 1 && method_name_length >= 1 && behavior_name_length >= 1,
                      "Name capacities must be >= 1");
}  // namespace mixCore::config
