#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "logging.hpp"
#include "posix_command_runner.hpp"
#include "composition/tierwatch_app.hpp"
#include "convergence/self_installer.hpp"
#include "convergence/sleeper.hpp"
#include "database/control_command_database.hpp"
#include "system_control/system_control.hpp"
#include "system_control/systemctl_service_manager.hpp"

namespace {

constexpr const char* TAG = "tierwatch";

void initLogging(const std::string& config_path) {
    auto r = logging::init(logging::Type::SpdLog, config_path);
    if (r) return;

    // still report somewhere
    auto fallback = logging::Logger::instance().init(logging::Type::Console, YAML::Node());
    if (!fallback) {
        fmt::print(stderr, "logging unavailable: {}\n", to_string(fallback));
        return;
    }
    LOG_WARN(TAG, "Log configuration not applied ({}), using console", to_string(r));
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"tierwatch - bring up a database tier and its dependent services in order"};

    composition::Invocation inv;
    try {
        inv = composition::parseInvocation(app, argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    manifest::TierManifest tier;
    int rc = composition::loadConfiguration(inv.config_path, tier, std::cerr);
    if (rc != composition::EXIT_OK) return rc;

    initLogging(inv.config_path);
    LOG_INFO(TAG, "Starting ({} mode)", inv.mode == composition::Mode::Setup ? "setup" : "converge");

    process::PosixCommandRunner runner;
    system_control::SystemctlServiceManager services(runner, tier.watcher.unit_dir);
    database::ControlCommandDatabase db(runner, tier.database);
    convergence::ThreadSleeper sleeper;
    convergence::SelfInstaller installer(tier, services);

    composition::TierwatchApp tierwatch(tier, services, db, sleeper, installer, std::cout);
    rc = tierwatch.run(inv.mode);

    system_control::notify_stopping();
    LOG_INFO(TAG, "Finished with exit status {}", rc);
    auto r = logging::Logger::instance().shutdown();
    if (!r) fmt::print(stderr, "log shutdown: {}\n", to_string(r));
    return rc;
}
