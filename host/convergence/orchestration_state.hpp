#pragma once

namespace convergence {

enum class OrchestrationState {
    Idle,
    EnsuringDatabase,
    WaitingForDatabase,
    StartingServices,
    Converged,
    Failed,
};

constexpr const char* to_string(OrchestrationState s) {
    switch (s) {
        case OrchestrationState::Idle:               return "Idle";
        case OrchestrationState::EnsuringDatabase:   return "EnsuringDatabase";
        case OrchestrationState::WaitingForDatabase: return "WaitingForDatabase";
        case OrchestrationState::StartingServices:   return "StartingServices";
        case OrchestrationState::Converged:          return "Converged";
        case OrchestrationState::Failed:             return "Failed";
    }
    return "Unknown";
}

constexpr bool isTerminal(OrchestrationState s) {
    return s == OrchestrationState::Converged || s == OrchestrationState::Failed;
}

} // namespace convergence
