#pragma once
#include <string>
#include <vector>

#include "system_snapshot.hpp"
#include "database/database_probe.hpp"
#include "system_control/service_manager.hpp"

namespace convergence {

// Read-only view of the database and the tracked services.
// A unit that cannot be queried reads as disabled/inactive with a warning.
class StateInspector {
public:
    StateInspector(system_control::ServiceManager& services,
                   database::DatabaseProbe& database,
                   std::vector<std::string> tracked)
        : services_(services), database_(database), tracked_(std::move(tracked)) {}

    SystemSnapshot snapshot();

    bool isServiceActive(const std::string& name);
    bool isServiceEnabled(const std::string& name);

    inline static constexpr const char* LOG_TAG = "StateInspector";

private:
    system_control::ServiceManager& services_;
    database::DatabaseProbe& database_;
    const std::vector<std::string> tracked_;
};

} // namespace convergence
