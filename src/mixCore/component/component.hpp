#pragma once

#include "../behavior/behavior.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../error/error_handler.hpp"
#include "../error/result.hpp"
#include "../event/event.hpp"
#include "../event/event_table.hpp"
#include "../event/owner.hpp"
#include "../platform/platform.hpp"

#include <etl/vector.h>
#include <cstddef>

namespace mixCore {

using behavior_name_t = string<config::behavior_name_length>;

/**
 * @brief Event-capable object that behaviors attach to
 *
 * Owns an ordered event table and a fixed set of named behavior slots.
 * Behaviors are borrowed. Every behavior attached here, named or not, is
 * tracked and detached by the destructor. One that detaches itself, directly
 * or from its destructor, releases its entries through behavior_detached().
 *
 * Names longer than their configured capacity are rejected, never truncated.
 */
class component : public events::Iowner {
private:
    struct behavior_slot {
        behavior_name_t name;
        behaviors::behavior* instance{nullptr};
    };

    events::event_table<config::max_event_handlers> events_;
    etl::vector<behavior_slot, config::max_behaviors> behaviors_;
    etl::vector<behaviors::behavior*, config::max_attached_behaviors> attached_;

    static bool valid_event_name(const char* name) noexcept {
        return fits_capacity<config::event_name_length>(name);
    }

public:
    component() noexcept = default;

    ~component() override {
        detach_behaviors();
        while (!attached_.empty()) {
            behaviors::behavior* instance = attached_.back();
            attached_.pop_back();
            const auto res = instance->detach();
            if (res.is_error()) {
                platform::logf("component: behavior detach reported %s", to_string(res.error()));
            }
        }
    }

    // ---- Iowner -------------------------------------------------------

    result<void, error_code> subscribe(const events::event_name_t& name, const events::handler_t& handler) noexcept override {
        return events_.on(name, handler);
    }

    result<void, error_code> unsubscribe(const events::event_name_t& name, const events::handler_t& handler) noexcept override {
        (void)events_.off(name, handler); // unknown pairs are a no-op by contract
        return ok();
    }

    result<void, error_code> behavior_attached(behaviors::behavior& instance) noexcept override {
        if (attached_.full()) {
            error::report_error(error::error_handler::make_context(
                error::error_event::registry_full, error::error_severity::error,
                error_code::out_of_memory, this));
            return fail(error_code::out_of_memory);
        }
        attached_.push_back(&instance);
        return ok();
    }

    // Keeps the registry in step with behaviors that detach themselves
    void behavior_detached(behaviors::behavior& instance) noexcept override {
        for (auto it = attached_.begin(); it != attached_.end(); ++it) {
            if (*it == &instance) {
                attached_.erase(it);
                break;
            }
        }
        for (auto it = behaviors_.begin(); it != behaviors_.end(); ++it) {
            if (it->instance == &instance) {
                behaviors_.erase(it);
                return;
            }
        }
    }

    // ---- Events -------------------------------------------------------

    result<void, error_code> on(const char* name, const events::handler_t& handler, bool append = true) noexcept {
        if (!valid_event_name(name)) {
            return fail(error_code::invalid_parameter);
        }
        return events_.on(events::event_name_t(name), handler, append);
    }

    bool off(const char* name, const events::handler_t& handler) noexcept {
        return valid_event_name(name) && events_.off(events::event_name_t(name), handler);
    }

    size_t off(const char* name) noexcept {
        return valid_event_name(name) ? events_.off(events::event_name_t(name)) : 0;
    }

    /**
     * @brief Trigger an event
     * @param name Event name; overwrites evt.name
     * @param evt Event record; sender, handled and ts are reset here
     * @return Number of handlers invoked; 0 for an over-long name
     */
    size_t trigger(const char* name, events::event& evt) noexcept {
        if (!valid_event_name(name)) {
            return 0;
        }
        evt.name.assign(name);
        evt.sender = this;
        evt.handled = false;
        evt.ts = platform::get_system_time_us();
        return events_.trigger(evt);
    }

    size_t trigger(const char* name) noexcept {
        events::event evt;
        return trigger(name, evt);
    }

    [[nodiscard]] bool has_event_handlers(const char* name) const noexcept {
        return valid_event_name(name) && events_.has_handlers(events::event_name_t(name));
    }

    [[nodiscard]] size_t event_handler_count(const char* name) const noexcept {
        return valid_event_name(name) ? events_.handler_count(events::event_name_t(name)) : 0;
    }

    [[nodiscard]] size_t event_handler_count() const noexcept { return events_.size(); }

    // ---- Behaviors ----------------------------------------------------

    /**
     * @brief Attach a behavior under a name
     *
     * A behavior already registered under the same name is detached first.
     * Nothing is registered if the behavior fails to attach.
     * An empty or over-long name is invalid_parameter.
     */
    result<void, error_code> attach_behavior(const char* name, behaviors::behavior& instance) noexcept {
        if (!fits_capacity<config::behavior_name_length>(name)) {
            return fail(error_code::invalid_parameter);
        }
        const behavior_name_t key(name);
        if (key.empty()) {
            return fail(error_code::invalid_parameter);
        }

        const auto previous = detach_behavior(name);
        if (previous.is_error() && previous.error() != error_code::not_found) {
            platform::logf("component: replaced behavior '%s' reported %s", key.c_str(), to_string(previous.error()));
        }

        if (behaviors_.full()) {
            error::report_error(error::error_handler::make_context(
                error::error_event::registry_full, error::error_severity::error,
                error_code::out_of_memory, this, key.c_str()));
            return fail(error_code::out_of_memory);
        }

        auto res = instance.attach(*this);
        if (res.is_error()) {
            return res;
        }

        behavior_slot slot; slot.name = key; slot.instance = &instance;
        behaviors_.push_back(slot);
        return ok();
    }

    /**
     * @brief Detach and unregister the behavior with the given name
     * @return The detached behavior, or not_found. An owner-side error from
     *         the detach is returned after the slot has been released.
     */
    result<behaviors::behavior*, error_code> detach_behavior(const char* name) noexcept {
        if (!fits_capacity<config::behavior_name_length>(name)) {
            return result<behaviors::behavior*, error_code>(error_code::not_found);
        }
        const behavior_name_t key(name);
        for (auto it = behaviors_.begin(); it != behaviors_.end(); ++it) {
            if (it->name == key) {
                behaviors::behavior* instance = it->instance;
                behaviors_.erase(it);
                const auto res = instance->detach();
                if (res.is_error()) {
                    return result<behaviors::behavior*, error_code>(res.error());
                }
                return ok(instance);
            }
        }
        return result<behaviors::behavior*, error_code>(error_code::not_found);
    }

    // Detach every registered behavior, most recent first
    void detach_behaviors() noexcept {
        while (!behaviors_.empty()) {
            behaviors::behavior* instance = behaviors_.back().instance;
            behaviors_.pop_back();
            const auto res = instance->detach();
            if (res.is_error()) {
                platform::logf("component: behavior detach reported %s", to_string(res.error()));
            }
        }
    }

    [[nodiscard]] behaviors::behavior* get_behavior(const char* name) const noexcept {
        if (!fits_capacity<config::behavior_name_length>(name)) {
            return nullptr;
        }
        const behavior_name_t key(name);
        for (const auto& slot : behaviors_) {
            if (slot.name == key) { return slot.instance; }
        }
        return nullptr;
    }

    [[nodiscard]] size_t behavior_count() const noexcept { return behaviors_.size(); }

    // Behaviors attached to this component, named or not
    [[nodiscard]] size_t attached_count() const noexcept { return attached_.size(); }
};

} // namespace mixCore
