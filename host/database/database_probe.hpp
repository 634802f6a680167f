#pragma once
#include "result.h"

namespace database {

enum class DatabaseState { Unknown, Healthy, Unhealthy };

constexpr const char* to_string(DatabaseState s) {
    switch (s) {
        case DatabaseState::Healthy:   return "Healthy";
        case DatabaseState::Unhealthy: return "Unhealthy";
        default:                       return "Unknown";
    }
}

// Control interface of the database tier.
class DatabaseProbe {
public:
    virtual ~DatabaseProbe() = default;

    // Never Unknown: anything short of a positive health report is Unhealthy.
    virtual DatabaseState health() = 0;
    virtual Result<void> start() = 0;
};

} // namespace database
