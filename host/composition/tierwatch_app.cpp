#include "tierwatch_app.hpp"

#include <CLI/CLI.hpp>
#include <fmt/ostream.h>

#include "logging.hpp"
#include "composition/convergence_manager.hpp"
#include "manifest/tier_manifest_loader.hpp"

namespace composition {

Invocation parseInvocation(CLI::App& app, int argc, const char* const* argv) {
    Invocation inv;
    app.add_option("-c,--config", inv.config_path, "Configuration file")->capture_default_str();
    auto* setup = app.add_subcommand("setup", "Install the persistent watcher unit and exit");
    // options the subcommand does not know go to the parent: `setup --config X`
    setup->fallthrough();

    app.parse(argc, argv);
    if (setup->parsed()) inv.mode = Mode::Setup;
    return inv;
}

int loadConfiguration(const std::string& path, manifest::TierManifest& tier, std::ostream& err) {
    auto loaded = manifest::TierManifestLoader::load(path);
    if (!loaded) {
        fmt::print(err, "Configuration error: {}\n", loaded.message());
        return EXIT_CONFIG;
    }
    tier = std::move(loaded.value());
    return EXIT_OK;
}

int TierwatchApp::setup() {
    auto status = installer_.ensureInstalled();
    if (status == convergence::InstallStatus::InstallFailed) {
        fmt::print(out_, "Setup failed: {}\n", installer_.lastError().message());
        return EXIT_FAILED;
    }
    LOGI("Setup finished: {}", convergence::to_string(status));
    fmt::print(out_, "Setup OK\n");
    return EXIT_OK;
}

int TierwatchApp::converge() {
    if (tier_.watcher.self_install) {
        auto status = installer_.ensureInstalled();
        if (status == convergence::InstallStatus::Installed && tier_.watcher.start_after_install) {
            // the freshly started watcher converges; running here too would race it
            LOGI("Watcher installed and started, leaving convergence to it");
            fmt::print(out_, "Setup OK\n");
            return EXIT_OK;
        }
        if (status == convergence::InstallStatus::InstallFailed)
            LOGW("Continuing without watcher: {}", installer_.lastError().message());
    }

    ConvergenceManager manager(tier_, services_, database_, sleeper_);

    auto outcome = manager.converge();
    if (manager.autostartChanged())
        fmt::print(out_, "Autostart configuration updated\n");

    if (outcome == ConvergenceOutcome::Failed) {
        fmt::print(out_, "Failed: {}\n", ::to_string(manager.failure()));
        return EXIT_FAILED;
    }

    LOGI("Database and services OK");
    fmt::print(out_, "Converged\n");
    return EXIT_OK;
}

} // namespace composition
