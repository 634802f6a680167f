#include "startup_orchestrator.hpp"

#include <fmt/core.h>

#include "logging.hpp"

namespace convergence {

using database::DatabaseState;

StartupOrchestrator::StartupOrchestrator(const manifest::TierManifest& manifest,
                                         system_control::ServiceManager& services,
                                         database::DatabaseProbe& database,
                                         StateInspector& inspector,
                                         Sleeper& sleeper)
    : manifest_(manifest),
      services_(services),
      database_(database),
      inspector_(inspector),
      sleeper_(sleeper),
      retry_(sleeper) {}

OrchestrationState StartupOrchestrator::step() {
    OrchestrationState next = state_;

    switch (state_) {
        case OrchestrationState::Idle:
            next = OrchestrationState::EnsuringDatabase;
            break;
        case OrchestrationState::EnsuringDatabase:
            next = onEnsuringDatabase();
            break;
        case OrchestrationState::WaitingForDatabase:
            next = onWaitingForDatabase();
            break;
        case OrchestrationState::StartingServices:
            next = onStartingServices();
            break;
        case OrchestrationState::Converged:
        case OrchestrationState::Failed:
            return state_;
    }

    transition(next);
    return state_;
}

Result<void> StartupOrchestrator::run() {
    while (!isTerminal())
        step();
    return failure_;
}

void StartupOrchestrator::transition(OrchestrationState next) {
    if (next == state_) return;
    const auto prev = state_;
    state_ = next;
    LOGI("{} -> {}", to_string(prev), to_string(next));
    if (listener_) listener_(prev, next);
}

OrchestrationState StartupOrchestrator::fail(ResultCode code, std::string reason) {
    LOGE("{}", reason);
    failure_ = Error(code, std::move(reason));
    return OrchestrationState::Failed;
}

OrchestrationState StartupOrchestrator::onEnsuringDatabase() {
    const auto& db = manifest_.database;

    // the control interface is unreachable until its host unit runs
    if (!inspector_.isServiceActive(db.unit)) {
        LOGI("Database unit {} is not active. Starting it...", db.unit);
        auto r = services_.start(db.unit);
        if (!r) {
            return fail(ResultCode::CommandFailed,
                        fmt::format("Failed to start database unit {}: {}", db.unit, r.message()));
        }
        LOGI("Database unit {} started. Settling for {} seconds", db.unit, db.settle_delay_sec);
        sleeper_.sleepFor(std::chrono::seconds(db.settle_delay_sec));
    }

    if (database_.health() == DatabaseState::Healthy) {
        LOGI("Database already online");
        database_ready_ = true;
        return OrchestrationState::StartingServices;
    }

    auto r = database_.start();
    if (!r) {
        return fail(ResultCode::CommandFailed,
                    fmt::format("Database start failed: {}", r.message()));
    }
    LOGI("Database start issued. Waiting for it to come online...");
    return OrchestrationState::WaitingForDatabase;
}

OrchestrationState StartupOrchestrator::onWaitingForDatabase() {
    const auto& db = manifest_.database;

    auto outcome = retry_.waitUntil(
        [this] { return database_.health() == DatabaseState::Healthy; },
        db.max_retries, db.retry_interval_sec);

    if (outcome == WaitOutcome::Exhausted) {
        return fail(ResultCode::Timeout,
                    fmt::format("Timeout: database not online after {} attempts", db.max_retries + 1));
    }

    database_ready_ = true;
    LOGI("Database online and ready");
    if (db.ready_delay_sec > 0) {
        LOGI("Letting the database settle for {} seconds", db.ready_delay_sec);
        sleeper_.sleepFor(std::chrono::seconds(db.ready_delay_sec));
    }
    return OrchestrationState::StartingServices;
}

OrchestrationState StartupOrchestrator::onStartingServices() {
    if (!database_ready_)
        return fail(ResultCode::InvalidState, "Refusing to start services before the database is online");

    for (const auto& name : manifest_.services) {
        if (inspector_.isServiceActive(name)) {
            LOGI("Service {} is active", name);
            continue;
        }

        LOGI("Starting service {}...", name);
        auto r = services_.start(name);
        if (!r) {
            return fail(ResultCode::CommandFailed,
                        fmt::format("Failed to start service {}: {}", name, r.message()));
        }
        sleeper_.sleepFor(std::chrono::seconds(manifest_.service_settle_delay_sec));
    }

    auto snap = inspector_.snapshot();
    if (snap.converged()) {
        LOGI("All services started successfully");
        return OrchestrationState::Converged;
    }

    std::string inactive;
    for (const auto& n : snap.inactiveServices()) {
        if (!inactive.empty()) inactive += ", ";
        inactive += n;
    }
    return fail(ResultCode::InvalidState,
                fmt::format("Not converged after start pass: database {}, inactive [{}]",
                            database::to_string(snap.db), inactive));
}

} // namespace convergence
