#pragma once

/**
 * @file mixCore.hpp
 * @brief Main header for mixCore - attachable behaviors for event-capable objects
 *
 * Header-only, no RTTI and no dynamic allocation.
 * Depends only on ETL (Embedded Template Library).
 *
 * @version 1.0.0
 */

#include "mixCore/core/types.hpp"
#include "mixCore/core/config.hpp"

#include "mixCore/error/result.hpp"
#include "mixCore/error/error_handler.hpp"
#include "mixCore/platform/platform.hpp"
#include "mixCore/event/event.hpp"
#include "mixCore/event/owner.hpp"
#include "mixCore/event/event_table.hpp"
#include "mixCore/behavior/handler_descriptor.hpp"
#include "mixCore/behavior/behavior.hpp"
#include "mixCore/component/component.hpp"

/**
 * @namespace mixCore
 * @brief Main namespace for the behavior attachment library
 */
namespace mixCore {

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return "1.0.0";
    }

} // namespace mixCore
