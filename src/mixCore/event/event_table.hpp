#pragma once

#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../platform/platform.hpp"
#include "event.hpp"
#include "event_types.hpp"

#include <etl/vector.h>
#include <cstddef>

namespace mixCore::events {

struct handler_registration {
    event_name_t name;
    handler_t fn;
};

// Ordered (name, handler) registry with synchronous dispatch (no RTTI/alloc).
// Copy/move disabled.
template <size_t MaxHandlers = config::max_event_handlers>
class event_table {
private:
    using list_t = etl::vector<handler_registration, MaxHandlers>;
    using snapshot_t = etl::vector<handler_t, MaxHandlers>;

    list_t handlers_;
    mutable platform::critical_section cs_;

public:
    static constexpr size_t capacity() noexcept { return MaxHandlers; }

    event_table() = default;
    event_table(const event_table&) = delete;
    event_table& operator=(const event_table&) = delete;
    event_table(event_table&&) = delete;
    event_table& operator=(event_table&&) = delete;
    ~event_table() = default;

    // Register a handler. append=false puts it ahead of the existing
    // handlers of the same event.
    result<void, error_code> on(const event_name_t& name, const handler_t& fn, bool append = true) noexcept {
        if (name.empty() || !fn.is_valid()) {
            return result<void, error_code>(error_code::invalid_parameter);
        }
        cs_.enter();
        if (handlers_.full()) {
            cs_.exit();
            return result<void, error_code>(error_code::out_of_memory);
        }
        handler_registration reg; reg.name = name; reg.fn = fn;
        if (append) {
            handlers_.push_back(reg);
        } else {
            auto pos = handlers_.begin();
            while (pos != handlers_.end() && !(pos->name == name)) { ++pos; }
            handlers_.insert(pos, reg);
        }
        cs_.exit();
        return ok();
    }

    // Remove the earliest registration equal to (name, fn); false if none
    bool off(const event_name_t& name, const handler_t& fn) noexcept {
        cs_.enter();
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->name == name && it->fn == fn) {
                handlers_.erase(it);
                cs_.exit();
                return true;
            }
        }
        cs_.exit();
        return false;
    }

    // Remove every handler of an event; returns how many were removed
    size_t off(const event_name_t& name) noexcept {
        cs_.enter();
        size_t removed = 0;
        auto it = handlers_.begin();
        while (it != handlers_.end()) {
            if (it->name == name) { it = handlers_.erase(it); ++removed; }
            else { ++it; }
        }
        cs_.exit();
        return removed;
    }

    void clear() noexcept {
        cs_.enter();
        handlers_.clear();
        cs_.exit();
    }

    // Dispatch to the handlers registered for evt.name, in order, until one
    // marks the event handled. Handlers run on a snapshot taken under the
    // lock, so they may register or remove handlers themselves.
    size_t trigger(event& evt) const noexcept {
        snapshot_t snapshot;
        cs_.enter();
        for (const auto& hnd : handlers_) {
            if (hnd.name == evt.name) { snapshot.push_back(hnd.fn); }
        }
        cs_.exit();

        size_t invoked = 0;
        for (const auto& fn : snapshot) {
            fn(evt);
            ++invoked;
            if (evt.handled) { break; }
        }
        return invoked;
    }

    // Introspection helpers
    [[nodiscard]] bool has_handlers(const event_name_t& name) const noexcept {
        return handler_count(name) > 0;
    }

    [[nodiscard]] size_t handler_count(const event_name_t& name) const noexcept {
        cs_.enter();
        size_t cnt = 0;
        for (const auto& hnd : handlers_) { if (hnd.name == name) { ++cnt; } }
        cs_.exit();
        return cnt;
    }

    [[nodiscard]] bool contains(const event_name_t& name, const handler_t& fn) const noexcept {
        cs_.enter();
        bool found = false;
        for (const auto& hnd : handlers_) {
            if (hnd.name == name && hnd.fn == fn) { found = true; break; }
        }
        cs_.exit();
        return found;
    }

    [[nodiscard]] size_t size() const noexcept {
        cs_.enter();
        const size_t cnt = handlers_.size();
        cs_.exit();
        return cnt;
    }
};

} // namespace mixCore::events
