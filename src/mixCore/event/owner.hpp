#pragma once

#include "../error/result.hpp"
#include "event.hpp"
#include "event_types.hpp"

namespace mixCore::behaviors { class behavior; }

namespace mixCore::events {

// Capability set a behavior needs from the object it attaches to.
// Implementations must keep per-event registration order, accept
// distinct duplicate delegates, and treat unsubscribe of an unknown
// (name, handler) pair as a successful no-op.
class Iowner {
public:
    virtual ~Iowner() = default;

    // Non-copyable, non-movable interface
    Iowner(const Iowner&) = delete;
    Iowner& operator=(const Iowner&) = delete;
    Iowner(Iowner&&) = delete;
    Iowner& operator=(Iowner&&) = delete;

public:
    Iowner() = default;

    virtual result<void, error_code> subscribe(const event_name_t& name, const handler_t& handler) noexcept = 0;
    virtual result<void, error_code> unsubscribe(const event_name_t& name, const handler_t& handler) noexcept = 0;

    // Called once a behavior has subscribed all of its handlers here. An
    // error fails the attach, which then withdraws those handlers again.
    virtual result<void, error_code> behavior_attached(behaviors::behavior& instance) noexcept {
        (void)instance;
        return ok();
    }

    // Called once a behavior has withdrawn all of its handlers from this owner
    virtual void behavior_detached(behaviors::behavior& instance) noexcept { (void)instance; }
};

} // namespace mixCore::events
