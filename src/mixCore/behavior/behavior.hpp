#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../error/error_handler.hpp"
#include "../error/result.hpp"
#include "../event/event.hpp"
#include "../event/owner.hpp"
#include "../platform/platform.hpp"
#include "handler_descriptor.hpp"

#include <etl/optional.h>
#include <etl/vector.h>
#include <cstddef>

namespace mixCore::behaviors {

using events::Iowner;

/**
 * @brief Subscription actually made on the current owner
 */
struct registration {
    event_name_t event;
    handler_t handler;
};

/**
 * @brief Attachable unit extending an owner through its events
 *
 * Subclasses declare bindings in events() and, for method-name bindings,
 * map names to bound delegates in resolve_method(). attach() subscribes the
 * resolved delegates on the owner and records them; detach() replays the
 * recorded values through unsubscribe, never re-resolving them.
 *
 * Not thread-safe: serialize attach()/detach() on one instance.
 * The owner is borrowed. It is told about the attachment through
 * Iowner::behavior_attached() and must detach the behavior before it dies
 * (component does); otherwise the owner must outlive the attachment.
 */
class behavior {
public:
    using registration_list = etl::vector<registration, config::max_behavior_events>;

    behavior() noexcept = default;

    // Registrations point at this instance
    behavior(const behavior&) = delete;
    behavior& operator=(const behavior&) = delete;
    behavior(behavior&&) = delete;
    behavior& operator=(behavior&&) = delete;

    // Subclass overrides have already been destroyed here, so only the base
    // teardown runs
    virtual ~behavior() {
        const auto res = behavior::detach();
        if (res.is_error()) {
            platform::logf("behavior: owner error during teardown (%s)", to_string(res.error()));
        }
    }

    /**
     * @brief Event bindings for the owner's events; empty by default
     *
     * Recomputed on every attach(). Iteration order is subscription order.
     * An event_map holds at most config::max_behavior_events bindings.
     */
    virtual event_map events() const noexcept { return event_map(); }

    /**
     * @brief Bind to an owner and subscribe everything events() declares
     * @return already_attached if an owner is set, invalid_parameter for a
     *         binding without an event name, unresolved_handler for a
     *         descriptor with no callable, or the owner's own error
     *
     * All-or-nothing: on failure every subscription made by this call is
     * withdrawn and the behavior is left detached.
     * Overrides must call the base implementation.
     */
    virtual result<void, error_code> attach(Iowner& owner) noexcept {
        if (owner_ != nullptr) {
            error::report_error(error::error_handler::make_context(
                error::error_event::attach_rejected, error::error_severity::warning,
                error_code::already_attached, this));
            return fail(error_code::already_attached);
        }

        owner_ = &owner;
        const event_map declared = events();
        for (const auto& binding : declared) {
            if (binding.event.empty()) {
                error::report_error(error::error_handler::make_context(
                    error::error_event::subscribe_failed, error::error_severity::error,
                    error_code::invalid_parameter, this));
                rollback();
                return fail(error_code::invalid_parameter);
            }

            handler_t handler;
            auto res = resolve(binding.handler, handler);
            if (res.is_error()) {
                error::report_error(error::error_handler::make_context(
                    error::error_event::handler_unresolved, error::error_severity::error,
                    res.error(), this, binding.event.c_str()));
                rollback();
                return res;
            }

            res = owner.subscribe(binding.event, handler);
            if (res.is_error()) {
                error::report_error(error::error_handler::make_context(
                    error::error_event::subscribe_failed, error::error_severity::error,
                    res.error(), this, binding.event.c_str()));
                rollback();
                return res;
            }

            registration reg; reg.event = binding.event; reg.handler = handler;
            registered_.push_back(reg);
            if constexpr (config::debug_enabled) {
                platform::logf("behavior: subscribed '%s'", binding.event.c_str());
            }
        }

        const auto accepted = owner.behavior_attached(*this);
        if (accepted.is_error()) {
            error::report_error(error::error_handler::make_context(
                error::error_event::attach_rejected, error::error_severity::error,
                accepted.error(), this));
            rollback();
            return accepted;
        }
        return ok();
    }

    /**
     * @brief Unsubscribe every recorded handler and drop the owner
     *
     * No-op when detached. Every recorded pair is attempted; the first owner
     * error (if any) is returned, and the behavior ends detached regardless.
     * Overrides must call the base implementation. The destructor calls
     * behavior::detach() only, never an override.
     */
    virtual result<void, error_code> detach() noexcept {
        if (owner_ == nullptr) {
            return ok();
        }

        result<void, error_code> first = ok();
        for (const auto& reg : registered_) {
            const auto res = owner_->unsubscribe(reg.event, reg.handler);
            if (res.is_error()) {
                error::report_error(error::error_handler::make_context(
                    error::error_event::unsubscribe_failed, error::error_severity::error,
                    res.error(), this, reg.event.c_str()));
                if (first.is_ok()) { first = res; }
            }
        }
        if constexpr (config::debug_enabled) {
            platform::logf("behavior: detached, %u handler(s) withdrawn", static_cast<u32>(registered_.size()));
        }
        registered_.clear();
        Iowner* previous = owner_;
        owner_ = nullptr;
        previous->behavior_detached(*this);
        return first;
    }

    [[nodiscard]] Iowner* owner() const noexcept { return owner_; }
    [[nodiscard]] bool is_attached() const noexcept { return owner_ != nullptr; }
    [[nodiscard]] const registration_list& registrations() const noexcept { return registered_; }
    [[nodiscard]] size_t registered_count() const noexcept { return registered_.size(); }

protected:
    /**
     * @brief Method table for method-name descriptors
     *
     * Return bind<Derived, &Derived::fn>() for each name the subclass
     * exposes; etl::nullopt makes attach() fail with unresolved_handler.
     */
    virtual etl::optional<handler_t> resolve_method(const method_name_t& name) noexcept {
        (void)name;
        return etl::nullopt;
    }

    // Delegate to a member of this instance
    template <typename T, void (T::*Method)(events::event&)>
    handler_t bind() noexcept {
        return handler_t::create<T, Method>(static_cast<T&>(*this));
    }

private:
    result<void, error_code> resolve(const handler_descriptor& desc, handler_t& out) noexcept {
        if (desc.is_method()) {
            const auto found = resolve_method(desc.method_name());
            if (!found.has_value() || !found.value().is_valid()) {
                return fail(error_code::unresolved_handler);
            }
            out = found.value();
            return ok();
        }
        if (!desc.function().is_valid()) {
            return fail(error_code::unresolved_handler);
        }
        out = desc.function();
        return ok();
    }

    // Undo a partial attach, newest subscription first
    void rollback() noexcept {
        while (!registered_.empty()) {
            const registration& reg = registered_.back();
            const auto res = owner_->unsubscribe(reg.event, reg.handler);
            if (res.is_error()) {
                error::report_error(error::error_handler::make_context(
                    error::error_event::unsubscribe_failed, error::error_severity::critical,
                    res.error(), this, reg.event.c_str()));
            }
            registered_.pop_back();
        }
        owner_ = nullptr;
    }

    Iowner* owner_{nullptr};
    registration_list registered_;
};

} // namespace mixCore::behaviors
