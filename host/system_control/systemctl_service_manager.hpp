#pragma once
#include <string>
#include <vector>

#include "service_manager.hpp"
#include "command_runner.hpp"

namespace system_control {

// ServiceManager over the systemctl CLI. Unit files are owned under `unit_dir`.
class SystemctlServiceManager : public ServiceManager {
public:
    SystemctlServiceManager(process::CommandRunner& runner, std::string unit_dir,
                            std::string systemctl = "systemctl")
        : runner_(runner), unit_dir_(std::move(unit_dir)), systemctl_(std::move(systemctl)) {}

    Result<bool> isEnabled(const std::string& unit) override;
    Result<bool> isActive(const std::string& unit) override;
    Result<void> enable(const std::string& unit) override;
    Result<void> disable(const std::string& unit) override;
    Result<void> start(const std::string& unit) override;
    Result<void> stop(const std::string& unit) override;

    bool hasUnit(const std::string& unit) override;
    Result<void> registerUnit(const UnitSpec& spec) override;
    Result<void> removeUnit(const std::string& unit) override;
    Result<void> reloadUnits() override;

    std::string unitPath(const std::string& unit) const;

    inline static constexpr const char* LOG_TAG = "systemctl";

    // `systemctl is-active` exit codes
    static constexpr int IS_ACTIVE_INACTIVE = 3;
    static constexpr int IS_ACTIVE_NO_UNIT = 4;

private:
    Result<process::CommandOutput> systemctl(const std::vector<std::string>& args);
    Result<void> mutate(const char* verb, const std::string& unit);

    process::CommandRunner& runner_;
    const std::string unit_dir_;
    const std::string systemctl_;
};

} // namespace system_control
