#pragma once
#include <functional>
#include <string>

#include "result.h"
#include "manifest/tier_manifest.hpp"
#include "system_control/service_manager.hpp"

namespace convergence {

enum class InstallStatus { AlreadyInstalled, Installed, InstallFailed };

constexpr const char* to_string(InstallStatus s) {
    switch (s) {
        case InstallStatus::AlreadyInstalled: return "AlreadyInstalled";
        case InstallStatus::Installed:        return "Installed";
        case InstallStatus::InstallFailed:    return "InstallFailed";
    }
    return "Unknown";
}

using ExecutableLocator = std::function<Result<std::string>()>;

// Absolute path of the running binary, from /proc/self/exe.
Result<std::string> currentExecutablePath();

// Registers this program as the watcher unit. Safe to call on every run.
class SelfInstaller {
public:
    SelfInstaller(const manifest::TierManifest& manifest,
                  system_control::ServiceManager& services,
                  ExecutableLocator locator = currentExecutablePath)
        : manifest_(manifest), services_(services), locator_(std::move(locator)) {}

    InstallStatus ensureInstalled();

    // registration derived from the manifest and the resolved executable
    Result<system_control::UnitSpec> buildUnitSpec() const;

    // reason of the last InstallFailed
    const Result<void>& lastError() const noexcept { return last_error_; }

    inline static constexpr const char* LOG_TAG = "SelfInstaller";

private:
    bool isInstalled();
    Result<void> removeStale(const std::string& unit);
    InstallStatus failed(Result<void> reason);

    const manifest::TierManifest manifest_;
    system_control::ServiceManager& services_;
    ExecutableLocator locator_;
    Result<void> last_error_;
};

} // namespace convergence
