#pragma once
#include <string>
#include <vector>

#include "database_probe.hpp"
#include "command_runner.hpp"
#include "manifest/tier_manifest.hpp"

namespace database {

// Drives the database through its control CLI (sapcontrol style):
// health is the probe's process list containing the healthy token.
class ControlCommandDatabase : public DatabaseProbe {
public:
    ControlCommandDatabase(process::CommandRunner& runner, const manifest::DatabaseInfo& info)
        : runner_(runner), info_(info) {}

    DatabaseState health() override;
    Result<void> start() override;

    // argv for `command`, wrapped in su when run_as is set
    std::vector<std::string> commandLine(const std::string& command) const;

    inline static constexpr const char* LOG_TAG = "database";

private:
    process::CommandRunner& runner_;
    const manifest::DatabaseInfo info_;
};

} // namespace database
