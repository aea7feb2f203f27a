#include <mixCore/mixCore.hpp>

using namespace mixCore;
using behaviors::behavior;
using behaviors::event_binding;
using behaviors::event_map;
using behaviors::handler_descriptor;
using behaviors::method_name_t;
using events::event;
using events::handler_t;

// Owner: a record that announces its saves
class document : public component {
public:
    u32 revision{0};

    bool save() noexcept {
        event evt;
        trigger("beforeSave", evt);
        if (evt.handled) {
            return false; // vetoed
        }
        ++revision;
        trigger("afterSave");
        return true;
    }
};

// Stamps the save time and refuses saves while locked
class timestamp_behavior : public behavior {
public:
    timestamp_t last_saved{0};
    bool locked{false};

    event_map events() const noexcept override {
        event_map map;
        map.push_back(event_binding("beforeSave", handler_descriptor::method("onBeforeSave")));
        map.push_back(event_binding("afterSave", handler_descriptor::method("onAfterSave")));
        return map;
    }

    void on_before_save(event& evt) { evt.handled = locked; }
    void on_after_save(event& evt) { last_saved = evt.ts; }

protected:
    etl::optional<handler_t> resolve_method(const method_name_t& name) noexcept override {
        if (name == method_name_t("onBeforeSave")) { return bind<timestamp_behavior, &timestamp_behavior::on_before_save>(); }
        if (name == method_name_t("onAfterSave")) { return bind<timestamp_behavior, &timestamp_behavior::on_after_save>(); }
        return etl::nullopt;
    }
};

void log_save(event& evt) {
    platform::logf("example: '%s' fired", evt.name.c_str());
}

// Pure declaration: a free function, no method table needed
class audit_behavior : public behavior {
public:
    event_map events() const noexcept override {
        event_map map;
        map.push_back(event_binding("afterSave", handler_t::create<&log_save>()));
        return map;
    }
};

int main() {
    document doc;
    timestamp_behavior stamp;
    audit_behavior audit;

    auto res = doc.attach_behavior("timestamp", stamp);
    if (res.is_error()) {
        platform::logf("example: attach failed (%s)", to_string(res.error()));
        return 1;
    }
    res = doc.attach_behavior("audit", audit);
    if (res.is_error()) {
        platform::logf("example: attach failed (%s)", to_string(res.error()));
        return 1;
    }

    (void)doc.save();
    stamp.locked = true;
    const bool saved = doc.save();
    platform::logf("example: locked save %s, revision %u", saved ? "went through" : "was vetoed", doc.revision);

    const auto detached = doc.detach_behavior("audit");
    if (detached.is_error()) {
        platform::logf("example: detach failed (%s)", to_string(detached.error()));
        return 1;
    }
    stamp.locked = false;
    (void)doc.save();
    platform::logf("example: %u handler(s) left after detaching audit", static_cast<u32>(doc.event_handler_count()));
    return 0;
}
