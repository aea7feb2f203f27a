#include <catch2/catch.hpp>

#include <mixCore/behavior/behavior.hpp>
#include <mixCore/component/component.hpp>
#include <mixCore/error/error_handler.hpp>

#include "recording_owner.hpp"

#include <string>

using namespace mixCore;
using behaviors::behavior;
using behaviors::event_binding;
using behaviors::event_map;
using behaviors::handler_descriptor;
using behaviors::method_name_t;
using events::event;
using events::event_name_t;
using events::handler_t;
using testing::recording_owner;

namespace {

// Declares {"beforeSave": "onBeforeSave"}
class save_audit : public behavior {
public:
    int before_save_calls{0};
    events::Iowner* last_sender{nullptr};

    event_map events() const noexcept override {
        event_map map;
        map.push_back(event_binding("beforeSave", handler_descriptor::method("onBeforeSave")));
        return map;
    }

    void on_before_save(event& evt) {
        ++before_save_calls;
        last_sender = evt.sender;
    }

protected:
    etl::optional<handler_t> resolve_method(const method_name_t& name) noexcept override {
        if (name == method_name_t("onBeforeSave")) {
            return bind<save_audit, &save_audit::on_before_save>();
        }
        return etl::nullopt;
    }
};

int free_calls = 0;
void count_free_call(event&) { ++free_calls; }

class call_counter {
public:
    int calls{0};
    void handle(event&) { ++calls; }
};

// Declares {"A": free function, "B": object method}
class two_events : public behavior {
public:
    explicit two_events(call_counter& counter) : counter_(counter) {}

    event_map events() const noexcept override {
        event_map map;
        map.push_back(event_binding("A", handler_t::create<&count_free_call>()));
        map.push_back(event_binding("B", handler_descriptor::callable(
            handler_t::create<call_counter, &call_counter::handle>(counter_))));
        return map;
    }

private:
    call_counter& counter_;
};

// First binding resolves, second names a method that does not exist
class half_resolvable : public behavior {
public:
    event_map events() const noexcept override {
        event_map map;
        map.push_back(event_binding("beforeSave", handler_descriptor::method("onBeforeSave")));
        map.push_back(event_binding("afterSave", handler_descriptor::method("onMissing")));
        return map;
    }

    void on_before_save(event&) {}

protected:
    etl::optional<handler_t> resolve_method(const method_name_t& name) noexcept override {
        if (name == method_name_t("onBeforeSave")) {
            return bind<half_resolvable, &half_resolvable::on_before_save>();
        }
        return etl::nullopt;
    }
};

// Declares whatever the test puts in `declared`
class configurable : public behavior {
public:
    event_map declared;
    mutable int events_calls{0};

    event_map events() const noexcept override {
        ++events_calls;
        return declared;
    }
};

error::error_event last_reported{error::error_event::invalid_state};
error_code last_reported_code{error_code::success};
void capture_error(const error::error_context& ctx) noexcept {
    last_reported = ctx.event;
    last_reported_code = ctx.code;
}

} // namespace

TEST_CASE("behavior with no declared events attaches without subscribing", "[behavior]") {
    behavior unit;
    recording_owner owner;

    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(unit.owner() == nullptr);

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(unit.is_attached());
    REQUIRE(unit.owner() == &owner);
    REQUIRE(unit.registered_count() == 0);
    REQUIRE(owner.calls.empty());

    REQUIRE(unit.detach().is_ok());
    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(owner.calls.empty());
}

TEST_CASE("beforeSave handler is invoked while attached and never after detach", "[behavior][scenario]") {
    component owner;
    save_audit audit;

    REQUIRE(audit.attach(owner).is_ok());
    REQUIRE(owner.event_handler_count("beforeSave") == 1);

    REQUIRE(owner.trigger("beforeSave") == 1);
    REQUIRE(audit.before_save_calls == 1);
    REQUIRE(audit.last_sender == &owner);

    REQUIRE(audit.detach().is_ok());
    REQUIRE_FALSE(owner.has_event_handlers("beforeSave"));

    REQUIRE(owner.trigger("beforeSave") == 0);
    REQUIRE(audit.before_save_calls == 1);
}

TEST_CASE("detach unsubscribes the exact delegate that attach subscribed", "[behavior]") {
    recording_owner owner;
    save_audit audit;

    REQUIRE(audit.attach(owner).is_ok());
    REQUIRE(audit.detach().is_ok());

    REQUIRE(owner.calls.size() == 2);
    const auto& sub = owner.calls[0];
    const auto& unsub = owner.calls[1];
    REQUIRE(sub.kind == recording_owner::op::subscribe);
    REQUIRE(unsub.kind == recording_owner::op::unsubscribe);
    REQUIRE(sub.name == event_name_t("beforeSave"));
    REQUIRE(unsub.name == sub.name);
    REQUIRE(unsub.handler == sub.handler);
    REQUIRE(owner.live.empty());

    // The bound delegate targets this instance, not another save_audit
    save_audit other;
    REQUIRE(other.attach(owner).is_ok());
    REQUIRE_FALSE(owner.calls.back().handler == sub.handler);
    REQUIRE(other.detach().is_ok());
}

TEST_CASE("subscriptions follow the declaration order of events()", "[behavior]") {
    recording_owner owner;
    call_counter counter;
    two_events unit(counter);

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(owner.calls.size() == 2);
    REQUIRE(owner.calls[0].name == event_name_t("A"));
    REQUIRE(owner.calls[1].name == event_name_t("B"));

    REQUIRE(unit.registered_count() == 2);
    REQUIRE(unit.registrations()[0].event == event_name_t("A"));
    REQUIRE(unit.registrations()[0].handler == owner.calls[0].handler);
    REQUIRE(unit.registrations()[1].event == event_name_t("B"));
    REQUIRE(unit.registrations()[1].handler == owner.calls[1].handler);

    REQUIRE(unit.detach().is_ok());
    REQUIRE(owner.count(recording_owner::op::unsubscribe) == 2);
    REQUIRE(owner.calls[2].name == event_name_t("A"));
    REQUIRE(owner.calls[3].name == event_name_t("B"));
}

TEST_CASE("attaching twice without detach fails and leaves the second owner untouched", "[behavior]") {
    error::get_global_error_handler().reset();
    error::get_global_error_handler().set_callback(&capture_error);

    recording_owner first;
    recording_owner second;
    save_audit audit;

    REQUIRE(audit.attach(first).is_ok());

    const auto res = audit.attach(second);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::already_attached);
    REQUIRE(second.calls.empty());
    REQUIRE(audit.owner() == &first);
    REQUIRE(audit.registered_count() == 1);
    REQUIRE(first.live.size() == 1);
    REQUIRE(last_reported == error::error_event::attach_rejected);

    REQUIRE(audit.detach().is_ok());
    REQUIRE(first.live.empty());
    error::get_global_error_handler().reset();
}

TEST_CASE("detach is idempotent", "[behavior]") {
    recording_owner owner;
    save_audit audit;

    REQUIRE(audit.detach().is_ok());
    REQUIRE(owner.calls.empty());

    REQUIRE(audit.attach(owner).is_ok());
    REQUIRE(audit.detach().is_ok());
    const auto calls_after_first = owner.calls.size();

    REQUIRE(audit.detach().is_ok());
    REQUIRE(owner.calls.size() == calls_after_first);
    REQUIRE(audit.owner() == nullptr);
    REQUIRE(audit.registered_count() == 0);
}

TEST_CASE("attach followed by detach restores the owner's subscriptions", "[behavior]") {
    component owner;
    call_counter existing;
    const handler_t existing_handler = handler_t::create<call_counter, &call_counter::handle>(existing);
    REQUIRE(owner.on("beforeSave", existing_handler).is_ok());
    REQUIRE(owner.on("A", existing_handler).is_ok());

    call_counter counter;
    two_events unit(counter);
    save_audit audit;

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(audit.attach(owner).is_ok());
    REQUIRE(owner.event_handler_count() == 5);

    REQUIRE(audit.detach().is_ok());
    REQUIRE(unit.detach().is_ok());

    REQUIRE(owner.event_handler_count() == 2);
    REQUIRE(owner.event_handler_count("beforeSave") == 1);
    REQUIRE(owner.event_handler_count("A") == 1);

    REQUIRE(owner.trigger("A") == 1);
    REQUIRE(existing.calls == 1);
    REQUIRE(counter.calls == 0);
}

TEST_CASE("unresolved method name rolls back the partial attach", "[behavior][errors]") {
    error::get_global_error_handler().reset();
    error::get_global_error_handler().set_callback(&capture_error);

    recording_owner owner;
    half_resolvable unit;

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::unresolved_handler);
    REQUIRE(last_reported == error::error_event::handler_unresolved);
    REQUIRE(last_reported_code == error_code::unresolved_handler);

    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(unit.registered_count() == 0);
    REQUIRE(owner.live.empty());
    REQUIRE(owner.count(recording_owner::op::subscribe) == 1);
    REQUIRE(owner.count(recording_owner::op::unsubscribe) == 1);
    REQUIRE(owner.calls[1].handler == owner.calls[0].handler);

    // Left detached: a retry fails on resolution again, not as already_attached
    const auto retry = unit.attach(owner);
    REQUIRE(retry.is_error());
    REQUIRE(retry.error() == error_code::unresolved_handler);
    REQUIRE(owner.live.empty());
    error::get_global_error_handler().reset();
}

TEST_CASE("owner refusing a subscription propagates its error and rolls back", "[behavior][errors]") {
    recording_owner owner;
    owner.fail_subscribe_at = 1;
    owner.fail_code = error_code::out_of_memory;

    call_counter counter;
    two_events unit(counter);

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::out_of_memory);
    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(owner.live.empty());
    REQUIRE(owner.calls.back().kind == recording_owner::op::unsubscribe);
    REQUIRE(owner.calls.back().name == event_name_t("A"));
}

TEST_CASE("empty delegate in events() cannot be resolved", "[behavior][errors]") {
    recording_owner owner;
    configurable unit;
    unit.declared.push_back(event_binding("init", handler_t()));

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::unresolved_handler);
    REQUIRE(owner.calls.empty());
    REQUIRE_FALSE(unit.is_attached());
}

TEST_CASE("detach attempts every unsubscription even when the owner reports errors", "[behavior][errors]") {
    recording_owner owner;
    call_counter counter;
    two_events unit(counter);

    REQUIRE(unit.attach(owner).is_ok());
    owner.fail_unsubscribe = true;
    owner.fail_code = error_code::invalid_parameter;

    const auto res = unit.detach();
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::invalid_parameter);
    REQUIRE(owner.count(recording_owner::op::unsubscribe) == 2);
    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(unit.registered_count() == 0);
}

TEST_CASE("detach tolerates handlers the owner already dropped", "[behavior]") {
    component owner;
    save_audit audit;

    REQUIRE(audit.attach(owner).is_ok());
    REQUIRE(owner.off("beforeSave") == 1);

    REQUIRE(audit.detach().is_ok());
    REQUIRE_FALSE(audit.is_attached());
}

TEST_CASE("events() is evaluated again on every attach", "[behavior]") {
    recording_owner owner;
    configurable unit;
    unit.declared.push_back(event_binding("A", handler_t::create<&count_free_call>()));

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(unit.registered_count() == 1);
    REQUIRE(unit.detach().is_ok());

    unit.declared.push_back(event_binding("B", handler_t::create<&count_free_call>()));
    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(unit.registered_count() == 2);
    REQUIRE(unit.events_calls == 2);
    REQUIRE(unit.detach().is_ok());
    REQUIRE(owner.live.empty());
}

TEST_CASE("a detached behavior can attach to a different owner", "[behavior]") {
    component first;
    component second;
    save_audit audit;

    REQUIRE(audit.attach(first).is_ok());
    REQUIRE(audit.detach().is_ok());
    REQUIRE(audit.attach(second).is_ok());
    REQUIRE(audit.owner() == &second);

    REQUIRE(first.trigger("beforeSave") == 0);
    REQUIRE(second.trigger("beforeSave") == 1);
    REQUIRE(audit.before_save_calls == 1);
    REQUIRE(audit.detach().is_ok());
}

TEST_CASE("free function and object method handlers are delivered and removed", "[behavior]") {
    component owner;
    call_counter counter;
    two_events unit(counter);
    free_calls = 0;

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(owner.trigger("A") == 1);
    REQUIRE(owner.trigger("B") == 1);
    REQUIRE(free_calls == 1);
    REQUIRE(counter.calls == 1);

    REQUIRE(unit.detach().is_ok());
    REQUIRE(owner.trigger("A") == 0);
    REQUIRE(owner.trigger("B") == 0);
    REQUIRE(free_calls == 1);
    REQUIRE(counter.calls == 1);
}

TEST_CASE("lambda handler declared by a behavior is removed on detach", "[behavior]") {
    component owner;
    int hits = 0;
    auto on_init = [&hits](event&) { ++hits; };

    configurable unit;
    unit.declared.push_back(event_binding("init", handler_t(on_init)));

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(owner.trigger("init") == 1);
    REQUIRE(unit.detach().is_ok());
    REQUIRE(owner.trigger("init") == 0);
    REQUIRE(hits == 1);
}

TEST_CASE("destroying an attached behavior withdraws its handlers", "[behavior]") {
    component owner;
    {
        save_audit audit;
        REQUIRE(audit.attach(owner).is_ok());
        REQUIRE(owner.has_event_handlers("beforeSave"));
    }
    REQUIRE_FALSE(owner.has_event_handlers("beforeSave"));
    REQUIRE(owner.trigger("beforeSave") == 0);
}

TEST_CASE("owner is told about every attach and detach", "[behavior]") {
    recording_owner owner;
    save_audit unit;

    REQUIRE(unit.attach(owner).is_ok());
    REQUIRE(owner.attached_notices == 1);
    REQUIRE(owner.detached_notices == 0);

    REQUIRE(unit.detach().is_ok());
    REQUIRE(unit.detach().is_ok());
    REQUIRE(owner.attached_notices == 1);
    REQUIRE(owner.detached_notices == 1);
}

TEST_CASE("owner refusing the behavior itself rolls back its subscriptions", "[behavior][errors]") {
    recording_owner owner;
    owner.refuse_behavior = true;
    owner.fail_code = error_code::out_of_memory;
    call_counter counter;
    two_events unit(counter);

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::out_of_memory);
    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(owner.live.empty());
    REQUIRE(owner.count(recording_owner::op::subscribe) == 2);
    REQUIRE(owner.count(recording_owner::op::unsubscribe) == 2);
    REQUIRE(owner.detached_notices == 0);
}

TEST_CASE("over-long event names in events() are rejected", "[behavior][errors]") {
    const std::string long_name(config::event_name_length + 1, 'e');
    recording_owner owner;
    configurable unit;
    unit.declared.push_back(event_binding("init", handler_t::create<&count_free_call>()));
    unit.declared.push_back(event_binding(long_name.c_str(), handler_t::create<&count_free_call>()));

    REQUIRE(unit.declared[1].event.empty());

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::invalid_parameter);
    REQUIRE_FALSE(unit.is_attached());
    REQUIRE(owner.live.empty());
    REQUIRE(owner.count(recording_owner::op::subscribe) == 1);
}

TEST_CASE("over-long method names cannot be resolved", "[behavior][errors]") {
    const std::string long_method(config::method_name_length + 1, 'm');
    const auto desc = handler_descriptor::method(long_method.c_str());
    REQUIRE_FALSE(desc.is_method());

    recording_owner owner;
    configurable unit;
    unit.declared.push_back(event_binding("init", desc));

    const auto res = unit.attach(owner);
    REQUIRE(res.is_error());
    REQUIRE(res.error() == error_code::unresolved_handler);
    REQUIRE(owner.calls.empty());
}

namespace {

class counting_detach : public save_audit {
public:
    explicit counting_detach(int& overrides) : overrides_(overrides) {}

    result<void, error_code> detach() noexcept override {
        ++overrides_;
        return behavior::detach();
    }

private:
    int& overrides_;
};

} // namespace

TEST_CASE("destruction runs the base detach, not an override", "[behavior]") {
    recording_owner owner;
    int overrides = 0;
    {
        counting_detach unit(overrides);
        REQUIRE(unit.attach(owner).is_ok());
    }
    REQUIRE(overrides == 0);
    REQUIRE(owner.live.empty());
    REQUIRE(owner.detached_notices == 1);
}
