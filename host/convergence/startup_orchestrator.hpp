#pragma once
#include <functional>
#include <string>

#include "result.h"
#include "orchestration_state.hpp"
#include "retry_policy.hpp"
#include "sleeper.hpp"
#include "state_inspector.hpp"
#include "database/database_probe.hpp"
#include "manifest/tier_manifest.hpp"
#include "system_control/service_manager.hpp"

namespace convergence {

/**
 * Drives the database and then the tracked services to the running state.
 *
 *   Idle -> EnsuringDatabase -> [WaitingForDatabase] -> StartingServices -> Converged
 *                  \                    \                      \
 *                   +--------------------+----------------------+-> Failed
 *
 * Fail-fast: the first failed stage ends the run, nothing is rolled back.
 * No tracked service is started before the database has reported Healthy.
 */
class StartupOrchestrator {
public:
    using TransitionListener = std::function<void(OrchestrationState from, OrchestrationState to)>;

    StartupOrchestrator(const manifest::TierManifest& manifest,
                        system_control::ServiceManager& services,
                        database::DatabaseProbe& database,
                        StateInspector& inspector,
                        Sleeper& sleeper);

    // Performs one transition. No-op in a terminal state.
    OrchestrationState step();

    // Steps until Converged or Failed.
    Result<void> run();

    OrchestrationState state() const noexcept { return state_; }
    bool isTerminal() const noexcept { return convergence::isTerminal(state_); }

    // OK unless the state is Failed
    const Result<void>& failure() const noexcept { return failure_; }

    void setTransitionListener(TransitionListener listener) { listener_ = std::move(listener); }

    inline static constexpr const char* LOG_TAG = "StartupOrchestrator";

private:
    OrchestrationState onEnsuringDatabase();
    OrchestrationState onWaitingForDatabase();
    OrchestrationState onStartingServices();

    OrchestrationState fail(ResultCode code, std::string reason);
    void transition(OrchestrationState next);

    const manifest::TierManifest manifest_;
    system_control::ServiceManager& services_;
    database::DatabaseProbe& database_;
    StateInspector& inspector_;
    Sleeper& sleeper_;
    RetryPolicy retry_;

    OrchestrationState state_ = OrchestrationState::Idle;
    Result<void> failure_;
    bool database_ready_ = false;
    TransitionListener listener_;
};

} // namespace convergence
