#include "autostart_reconciler.hpp"

#include "logging.hpp"

namespace convergence {

bool AutostartReconciler::reconcile(const std::vector<ServiceState>& services) {
    bool changed = false;
    LOGI("Checking autostart of {} services", services.size());

    for (const auto& s : services) {
        if (!s.enabled) continue;

        LOGI("Disabling autostart of {}", s.name);
        auto r = services_.disable(s.name);
        if (!r) {
            LOGW("Failed to disable autostart of {}: {}", s.name, r.message());
            continue;
        }
        changed = true;
        LOGI("Autostart of {} disabled", s.name);
    }
    return changed;
}

} // namespace convergence
