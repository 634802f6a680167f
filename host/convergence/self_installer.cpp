#include "self_installer.hpp"

#include <filesystem>
#include <system_error>
#include <fmt/core.h>

#include "logging.hpp"

namespace fs = std::filesystem;

namespace convergence {

Result<std::string> currentExecutablePath() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return Result<std::string>::Error(ResultCode::InstallFailed,
            fmt::format("cannot resolve /proc/self/exe: {}", ec.message()));
    }
    return Result<std::string>::OK(p.string());
}

Result<system_control::UnitSpec> SelfInstaller::buildUnitSpec() const {
    using R = Result<system_control::UnitSpec>;
    const auto& w = manifest_.watcher;

    auto exe = locator_();
    if (!exe) {
        return R::Error(ResultCode::InstallFailed,
            fmt::format("cannot resolve executable path: {}", exe.message()));
    }

    fs::path exe_path(exe.value());
    if (exe_path.empty() || !exe_path.is_absolute())
        return R::Error(ResultCode::InstallFailed, fmt::format("executable path is not absolute: '{}'", exe.value()));

    std::error_code ec;
    if (!fs::is_regular_file(exe_path, ec))
        return R::Error(ResultCode::InstallFailed, fmt::format("executable not found: {}", exe_path.string()));

    system_control::UnitSpec spec;
    spec.name = w.name;
    spec.description = w.description;
    spec.exec_path = exe_path.lexically_normal().string();
    spec.working_dir = w.working_dir.empty() ? exe_path.parent_path().string() : w.working_dir;
    spec.log_path = w.log_file.empty()
        ? (fs::path(spec.working_dir) / manifest::DEFAULT_WATCHER_LOG).string()
        : w.log_file;
    if (!manifest_.source.empty())
        spec.exec_args = {"--config", manifest_.source};

    return R::OK(std::move(spec));
}

bool SelfInstaller::isInstalled() {
    const auto& unit = manifest_.watcher.name;
    if (!services_.hasUnit(unit)) return false;

    auto enabled = services_.isEnabled(unit);
    if (!enabled) {
        LOGW("Cannot query autostart of {}: {}", unit, enabled.message());
        return false;
    }
    return enabled.value();
}

Result<void> SelfInstaller::removeStale(const std::string& unit) {
    LOGI("Removing existing registration of {}", unit);

    auto r = services_.stop(unit);
    if (!r) LOGW("Stopping {} failed: {}", unit, r.message());
    r = services_.disable(unit);
    if (!r) LOGW("Disabling {} failed: {}", unit, r.message());

    return services_.removeUnit(unit);
}

InstallStatus SelfInstaller::failed(Result<void> reason) {
    last_error_ = Error(ResultCode::InstallFailed, reason.message());
    LOGE("Watcher installation failed: {}", last_error_.c_str());
    return InstallStatus::InstallFailed;
}

InstallStatus SelfInstaller::ensureInstalled() {
    const auto& unit = manifest_.watcher.name;
    last_error_ = OK();

    if (isInstalled()) {
        LOGD("Watcher {} already installed", unit);
        return InstallStatus::AlreadyInstalled;
    }

    LOGI("Watcher {} not configured. Installing...", unit);

    auto spec = buildUnitSpec();
    if (!spec) return failed(Result<void>::from(spec));

    if (services_.hasUnit(unit)) {
        auto r = removeStale(unit);
        if (!r) return failed(r);
    }

    auto r = services_.registerUnit(spec.value());
    if (!r) return failed(r);

    r = services_.reloadUnits();
    if (!r) return failed(r);

    r = services_.enable(unit);
    if (!r) return failed(r);

    auto enabled = services_.isEnabled(unit);
    if (!enabled || !enabled.value())
        return failed(Error(ResultCode::InstallFailed, fmt::format("{} is not enabled after enable", unit)));

    if (manifest_.watcher.start_after_install) {
        auto s = services_.start(unit);
        if (!s) LOGE("Watcher installed but not started: {}", s.message());
    }

    LOGI("Watcher {} installed for {}", unit, spec.value().exec_path);
    return InstallStatus::Installed;
}

} // namespace convergence
