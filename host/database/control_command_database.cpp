#include "control_command_database.hpp"

#include <fmt/core.h>

#include "logging.hpp"
#include "result_helper.hpp"

namespace database {

std::vector<std::string> ControlCommandDatabase::commandLine(const std::string& command) const {
    if (info_.run_as.empty())
        return {"/bin/sh", "-c", command};
    return {"su", "-", info_.run_as, "-c", command};
}

DatabaseState ControlCommandDatabase::health() {
    auto r = runner_.run(commandLine(info_.probe_command));
    if (!r) {
        LOGE("Health probe could not run: {}", r.message());
        return DatabaseState::Unhealthy;
    }

    const auto& out = r.value();
    if (out.succeeded() && out.output.find(info_.healthy_token) != std::string::npos) {
        LOGI("Database is online");
        return DatabaseState::Healthy;
    }

    LOGW("Database not online (exit {}). Output: {}", out.exit_code, out.output);
    return DatabaseState::Unhealthy;
}

Result<void> ControlCommandDatabase::start() {
    LOGI("Running database start command");
    auto r = runner_.run(commandLine(info_.start_command));
    RETURN_IF_ERR_MSG(r, "database start command could not run");

    if (!r.value().succeeded()) {
        LOGE("Database start failed (exit {}). Output: {}", r.value().exit_code, r.value().output);
        return Error(ResultCode::CommandFailed,
                     fmt::format("database start command exited with {}", r.value().exit_code));
    }
    return OK();
}

} // namespace database
