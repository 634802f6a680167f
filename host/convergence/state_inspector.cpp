#include "state_inspector.hpp"

#include "logging.hpp"

namespace convergence {

SystemSnapshot StateInspector::snapshot() {
    SystemSnapshot snap;

    // database first: services behind an unhealthy database are not ready anyway
    snap.db = database_.health();

    snap.services.reserve(tracked_.size());
    for (const auto& name : tracked_) {
        ServiceState s;
        s.name = name;
        s.enabled = isServiceEnabled(name);
        s.active = isServiceActive(name);
        snap.services.push_back(std::move(s));
    }

    LOGI("Snapshot: database {}, {} of {} services active",
         database::to_string(snap.db),
         snap.services.size() - snap.inactiveServices().size(), snap.services.size());
    return snap;
}

bool StateInspector::isServiceActive(const std::string& name) {
    auto r = services_.isActive(name);
    if (!r) {
        LOGW("Cannot query state of {}: {}. Treating as inactive.", name, r.message());
        return false;
    }
    LOGD("Service {} is {}", name, r.value() ? "active" : "inactive");
    return r.value();
}

bool StateInspector::isServiceEnabled(const std::string& name) {
    auto r = services_.isEnabled(name);
    if (!r) {
        LOGW("Cannot query autostart of {}: {}. Treating as disabled.", name, r.message());
        return false;
    }
    return r.value();
}

} // namespace convergence
