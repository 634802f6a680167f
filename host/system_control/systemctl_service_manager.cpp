#include "systemctl_service_manager.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <fmt/core.h>

#include "logging.hpp"
#include "posix_command_runner.hpp"
#include "result_helper.hpp"
#include "unit_file.hpp"

namespace fs = std::filesystem;

namespace system_control {

namespace {

std::string firstLine(const std::string& s) {
    auto end = s.find('\n');
    return s.substr(0, end);
}

} // namespace

Result<process::CommandOutput> SystemctlServiceManager::systemctl(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(systemctl_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto r = runner_.run(argv);
    if (!r) return r;
    if (r.value().exit_code == process::PosixCommandRunner::EXEC_FAILED) {
        return Result<process::CommandOutput>::Error(ResultCode::InternalError,
            fmt::format("cannot execute {}: {}", systemctl_, firstLine(r.value().output)));
    }
    return r;
}

Result<bool> SystemctlServiceManager::isEnabled(const std::string& unit) {
    auto r = systemctl({"is-enabled", unit});
    if (!r) return Result<bool>::Error(r.code(), r.error());
    return Result<bool>::OK(r.value().succeeded());
}

Result<bool> SystemctlServiceManager::isActive(const std::string& unit) {
    auto r = systemctl({"is-active", unit});
    if (!r) return Result<bool>::Error(r.code(), r.error());

    switch (r.value().exit_code) {
        case 0:
            return Result<bool>::OK(true);
        case IS_ACTIVE_INACTIVE:
            return Result<bool>::OK(false);
        case IS_ACTIVE_NO_UNIT:
            return Result<bool>::Error(ResultCode::NotFound, fmt::format("no such unit: {}", unit));
        default:
            return Result<bool>::Error(ResultCode::CommandFailed,
                fmt::format("is-active {} exited with {}: {}", unit, r.value().exit_code, firstLine(r.value().output)));
    }
}

Result<void> SystemctlServiceManager::mutate(const char* verb, const std::string& unit) {
    auto r = systemctl({verb, unit});
    RETURN_IF_ERR(r);
    if (!r.value().succeeded()) {
        return Error(ResultCode::CommandFailed,
            fmt::format("{} {} exited with {}: {}", verb, unit, r.value().exit_code, firstLine(r.value().output)));
    }
    return OK();
}

Result<void> SystemctlServiceManager::enable(const std::string& unit) {
    return mutate("enable", unit);
}

Result<void> SystemctlServiceManager::disable(const std::string& unit) {
    return mutate("disable", unit);
}

Result<void> SystemctlServiceManager::start(const std::string& unit) {
    return mutate("start", unit);
}

Result<void> SystemctlServiceManager::stop(const std::string& unit) {
    return mutate("stop", unit);
}

Result<void> SystemctlServiceManager::reloadUnits() {
    auto r = systemctl({"daemon-reload"});
    RETURN_IF_ERR(r);
    if (!r.value().succeeded()) {
        return Error(ResultCode::CommandFailed,
            fmt::format("daemon-reload exited with {}: {}", r.value().exit_code, firstLine(r.value().output)));
    }
    return OK();
}

std::string SystemctlServiceManager::unitPath(const std::string& unit) const {
    return (fs::path(unit_dir_) / unit).string();
}

bool SystemctlServiceManager::hasUnit(const std::string& unit) {
    std::error_code ec;
    return fs::is_regular_file(unitPath(unit), ec);
}

Result<void> SystemctlServiceManager::registerUnit(const UnitSpec& spec) {
    if (spec.name.empty() || spec.exec_path.empty())
        return Error(ResultCode::InvalidArgument, "unit name and exec path are required");

    const std::string path = unitPath(spec.name);
    const std::string tmp = path + ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out)
            return Error(ResultCode::PermissionDenied, fmt::format("cannot write {}", tmp));
        out << renderUnitFile(spec);
        out.close();
        if (!out)
            return Error(ResultCode::InternalError, fmt::format("write failed: {}", tmp));
    }

    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write |
                         fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) LOGW("chmod {}: {}", tmp, ec.message());

    // rename keeps a single file under the unit name at every instant
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return Error(ResultCode::InternalError, fmt::format("rename {} -> {}: {}", tmp, path, ec.message()));
    }

    LOGI("Unit file written: {}", path);
    return OK();
}

Result<void> SystemctlServiceManager::removeUnit(const std::string& unit) {
    std::error_code ec;
    const std::string path = unitPath(unit);
    if (!fs::remove(path, ec)) {
        if (ec) return Error(ResultCode::InternalError, fmt::format("remove {}: {}", path, ec.message()));
        return DuplicateIgnored(fmt::format("{} not present", path));
    }
    LOGI("Unit file removed: {}", path);
    return OK();
}

} // namespace system_control
