#pragma once
#include <string>
#include <vector>
#include <algorithm>

#include "database/database_probe.hpp"

namespace convergence {

struct ServiceState {
    std::string name;
    bool enabled = false;   // autostart at boot
    bool active = false;
};

struct SystemSnapshot {
    database::DatabaseState db = database::DatabaseState::Unknown;
    std::vector<ServiceState> services;

    bool allActive() const {
        return std::all_of(services.begin(), services.end(),
                           [](const ServiceState& s) { return s.active; });
    }

    bool converged() const {
        return db == database::DatabaseState::Healthy && allActive();
    }

    std::vector<std::string> inactiveServices() const {
        std::vector<std::string> out;
        for (const auto& s : services)
            if (!s.active) out.push_back(s.name);
        return out;
    }
};

} // namespace convergence
