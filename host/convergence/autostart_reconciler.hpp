#pragma once
#include <vector>

#include "system_snapshot.hpp"
#include "system_control/service_manager.hpp"

namespace convergence {

// Turns boot-time autostart off for services this tool starts itself.
// Never enables anything.
class AutostartReconciler {
public:
    explicit AutostartReconciler(system_control::ServiceManager& services)
        : services_(services) {}

    // true when at least one service was disabled
    bool reconcile(const std::vector<ServiceState>& services);

    inline static constexpr const char* LOG_TAG = "AutostartReconciler";

private:
    system_control::ServiceManager& services_;
};

} // namespace convergence
