#include "convergence_manager.hpp"

#include <fmt/core.h>

#include "logging.hpp"
#include "system_control/system_control.hpp"

namespace composition {

using convergence::OrchestrationState;

ConvergenceManager::ConvergenceManager(const manifest::TierManifest& manifest,
                                       system_control::ServiceManager& services,
                                       database::DatabaseProbe& database,
                                       convergence::Sleeper& sleeper)
    : inspector_(services, database, manifest.services),
      reconciler_(services),
      orchestrator_(manifest, services, database, inspector_, sleeper) {
    orchestrator_.setTransitionListener([](OrchestrationState, OrchestrationState to) {
        system_control::notify_status(convergence::to_string(to));
    });
}

ConvergenceOutcome ConvergenceManager::converge() {
    LOGI("Checking database and services...");

    auto snap = inspector_.snapshot();
    if (snap.converged()) {
        LOGI("Database and all services are running");
        system_control::notify_status("Converged");
        return ConvergenceOutcome::AlreadyConverged;
    }

    autostart_changed_ = reconciler_.reconcile(snap.services);
    if (autostart_changed_)
        LOGI("Autostart configuration updated");

    auto r = orchestrator_.run();
    if (!r) {
        LOGE("Convergence failed: {}", to_string(r));
        system_control::notify_status(fmt::format("Failed: {}", r.message()));
        return ConvergenceOutcome::Failed;
    }
    return ConvergenceOutcome::Converged;
}

} // namespace composition
