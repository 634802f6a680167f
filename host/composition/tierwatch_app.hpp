#pragma once
#include <ostream>
#include <string>

#include "result.h"
#include "convergence/self_installer.hpp"
#include "convergence/sleeper.hpp"
#include "database/database_probe.hpp"
#include "manifest/tier_manifest.hpp"
#include "system_control/service_manager.hpp"

namespace CLI { class App; }

namespace composition {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CONFIG = 2;

inline constexpr const char* DEFAULT_CONFIG = "/etc/tierwatch/tierwatch.yaml";

enum class Mode { Converge, Setup };

struct Invocation {
    std::string config_path = DEFAULT_CONFIG;
    Mode mode = Mode::Converge;
};

// Declares the command line on `app` and parses it. `--config` is accepted
// before or after `setup`. Throws CLI::ParseError, to be handed to app.exit().
Invocation parseInvocation(CLI::App& app, int argc, const char* const* argv);

// Loads `path` into `tier`. EXIT_OK, or EXIT_CONFIG with the reason on `err`.
int loadConfiguration(const std::string& path, manifest::TierManifest& tier, std::ostream& err);

// One tierwatch invocation over already built collaborators. Status lines
// go to `out`; the return value is the process exit status.
class TierwatchApp {
public:
    TierwatchApp(const manifest::TierManifest& tier,
                 system_control::ServiceManager& services,
                 database::DatabaseProbe& database,
                 convergence::Sleeper& sleeper,
                 convergence::SelfInstaller& installer,
                 std::ostream& out)
        : tier_(tier), services_(services), database_(database),
          sleeper_(sleeper), installer_(installer), out_(out) {}

    int run(Mode mode) { return mode == Mode::Setup ? setup() : converge(); }

    // installs the watcher unit only
    int setup();
    // self-install when configured, then converge
    int converge();

    inline static constexpr const char* LOG_TAG = "tierwatch";

private:
    const manifest::TierManifest& tier_;
    system_control::ServiceManager& services_;
    database::DatabaseProbe& database_;
    convergence::Sleeper& sleeper_;
    convergence::SelfInstaller& installer_;
    std::ostream& out_;
};

} // namespace composition
