#pragma once
#include <string>

#include "result.h"
#include "convergence/autostart_reconciler.hpp"
#include "convergence/sleeper.hpp"
#include "convergence/startup_orchestrator.hpp"
#include "convergence/state_inspector.hpp"
#include "database/database_probe.hpp"
#include "manifest/tier_manifest.hpp"
#include "system_control/service_manager.hpp"

namespace composition {

enum class ConvergenceOutcome { AlreadyConverged, Converged, Failed };

// One inspect -> reconcile -> converge run.
class ConvergenceManager {
public:
    ConvergenceManager(const manifest::TierManifest& manifest,
                       system_control::ServiceManager& services,
                       database::DatabaseProbe& database,
                       convergence::Sleeper& sleeper);

    ConvergenceOutcome converge();

    bool autostartChanged() const noexcept { return autostart_changed_; }
    convergence::OrchestrationState orchestrationState() const noexcept { return orchestrator_.state(); }
    const Result<void>& failure() const noexcept { return orchestrator_.failure(); }

    inline static constexpr const char* LOG_TAG = "ConvergenceManager";

private:
    convergence::StateInspector inspector_;
    convergence::AutostartReconciler reconciler_;
    convergence::StartupOrchestrator orchestrator_;
    bool autostart_changed_ = false;
};

} // namespace composition
