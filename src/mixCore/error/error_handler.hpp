#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace mixCore {
namespace error {

/**
 * @brief Error event types for callbacks
 */
enum class error_event : u8 {
    attach_rejected,      // attach() on a behavior that already has an owner
    handler_unresolved,   // descriptor resolved to no callable
    subscribe_failed,     // owner refused a subscription
    unsubscribe_failed,   // owner reported an error while removing a handler
    registry_full,        // component has no free behavior slot
    invalid_state
};

/**
 * @brief Error severity levels
 */
enum class error_severity : u8 {
    info,       // Informational, no action needed
    warning,    // Warning, may need attention
    error,      // Error, requires handling
    critical    // Critical, owner/behavior bookkeeping may be inconsistent
};

constexpr const char* to_string(error_event event) noexcept {
    switch (event) {
        case error_event::attach_rejected:    return "attach_rejected";
        case error_event::handler_unresolved: return "handler_unresolved";
        case error_event::subscribe_failed:   return "subscribe_failed";
        case error_event::unsubscribe_failed: return "unsubscribe_failed";
        case error_event::registry_full:      return "registry_full";
        case error_event::invalid_state:      return "invalid_state";
    }
    return "unknown";
}

/**
 * @brief Error context information
 */
struct error_context {
    error_event event{error_event::invalid_state};
    error_severity severity{error_severity::error};
    error_code code{error_code::invalid_parameter};
    const void* source{nullptr};   // behavior or component that raised it
    timestamp_t timestamp{0};
    string<config::event_name_length> subject;   // event or behavior name involved

    error_context() noexcept = default;
};

/**
 * @brief Error handler callback type
 */
using error_handler_fn = void(*)(const error_context& ctx) noexcept;

/**
 * @brief Global error handler configuration
 */
class error_handler {
private:
    error_handler_fn callback_{nullptr};
    bool enabled_{false};
    u32 error_count_{0};
    error_context last_error_;

public:
    error_handler() noexcept = default;

    /**
     * @brief Set error handler callback
     */
    void set_callback(error_handler_fn callback) noexcept {
        callback_ = callback;
        enabled_ = (callback != nullptr);
    }

    /**
     * @brief Report an error
     */
    void report_error(const error_context& ctx) noexcept {
        error_count_++;
        last_error_ = ctx;

        if (enabled_ && callback_ != nullptr) {
            callback_(ctx);
        }

        if (ctx.severity >= error_severity::critical) {
            platform::logf("CRITICAL ERROR: event=%s subject=%s code=-%u",
                           to_string(ctx.event),
                           ctx.subject.c_str(),
                           static_cast<u32>(-static_cast<int>(ctx.code)));
        }
    }

    /**
     * @brief Create error context helper
     */
    static error_context make_context(
        error_event event,
        error_severity severity,
        error_code code,
        const void* source,
        const char* subject = ""
    ) noexcept {
        error_context ctx;
        ctx.event = event;
        ctx.severity = severity;
        ctx.code = code;
        ctx.source = source;
        ctx.subject.assign(subject);
        ctx.timestamp = platform::get_system_time_us();
        return ctx;
    }

    u32 get_error_count() const noexcept {
        return error_count_;
    }

    const error_context& get_last_error() const noexcept {
        return last_error_;
    }

    /**
     * @brief Reset error statistics and drop the callback
     */
    void reset() noexcept {
        error_count_ = 0;
        last_error_ = error_context();
        set_callback(nullptr);
    }
};

/**
 * @brief Global error handler instance
 */
inline error_handler& get_global_error_handler() noexcept {
    static error_handler handler;
    return handler;
}

/**
 * @brief Convenience function to report errors
 */
inline void report_error(const error_context& ctx) noexcept {
    get_global_error_handler().report_error(ctx);
}

} // namespace error
} // namespace mixCore
