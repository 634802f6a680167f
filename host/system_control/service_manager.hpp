#pragma once
#include <string>
#include <vector>

#include "result.h"

namespace system_control {

// Registration of a unit whose file this tool owns.
struct UnitSpec {
    std::string name;                     // e.g. tierwatch.service
    std::string description;
    std::string exec_path;                // absolute
    std::vector<std::string> exec_args;
    std::string working_dir;
    std::string log_path;                 // stdout/stderr appended here
};

// Host init system, addressed by unit name.
// Queries return an error Result only when the state could not be read.
class ServiceManager {
public:
    virtual ~ServiceManager() = default;

    virtual Result<bool> isEnabled(const std::string& unit) = 0;
    virtual Result<bool> isActive(const std::string& unit) = 0;
    virtual Result<void> enable(const std::string& unit) = 0;
    virtual Result<void> disable(const std::string& unit) = 0;
    virtual Result<void> start(const std::string& unit) = 0;
    virtual Result<void> stop(const std::string& unit) = 0;

    virtual bool hasUnit(const std::string& unit) = 0;
    virtual Result<void> registerUnit(const UnitSpec& spec) = 0;
    virtual Result<void> removeUnit(const std::string& unit) = 0;
    virtual Result<void> reloadUnits() = 0;
};

} // namespace system_control
