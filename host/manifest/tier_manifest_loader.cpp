#include "tier_manifest_loader.hpp"

#include <filesystem>
#include <fmt/core.h>

#include "logging.hpp"

namespace manifest {

namespace {

uint32_t readUnsigned(const YAML::Node& node, const char* key, uint32_t fallback) {
    if (!node[key]) return fallback;
    int v = node[key].as<int>();
    if (v < 0)
        throw YAML::Exception(node[key].Mark(), fmt::format("{} must not be negative", key));
    return static_cast<uint32_t>(v);
}

} // namespace

Result<TierManifest> TierManifestLoader::load(const std::string& path) {
    using R = Result<TierManifest>;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return R::Error(ResultCode::NotFound, fmt::format("cannot read {}", path));
    } catch (const YAML::Exception& e) {
        return R::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
    }

    auto m = parse(root);
    if (!m) {
        return R::Error(m.code(), fmt::format("{}: {}", path, m.error().value_or("invalid manifest")));
    }

    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    m.value().source = ec ? path : abs.lexically_normal().string();
    LOG_DEBUG(LOG_TAG, "Manifest loaded from {} ({} services)", m.value().source, m.value().services.size());
    return m;
}

Result<TierManifest> TierManifestLoader::parse(const YAML::Node& root) {
    using R = Result<TierManifest>;
    TierManifest m;

    try {
        // ---------------------------
        // database
        // ---------------------------
        if (auto db = root["database"]) {
            auto& d = m.database;
            d.unit = db["unit"].as<std::string>(d.unit);
            d.run_as = db["run_as"].as<std::string>(d.run_as);
            d.probe_command = db["probe_command"].as<std::string>(d.probe_command);
            d.start_command = db["start_command"].as<std::string>(d.start_command);
            d.healthy_token = db["healthy_token"].as<std::string>(d.healthy_token);
            d.max_retries = readUnsigned(db, "max_retries", d.max_retries);
            d.retry_interval_sec = readUnsigned(db, "retry_interval_sec", d.retry_interval_sec);
            d.settle_delay_sec = readUnsigned(db, "settle_delay_sec", d.settle_delay_sec);
            d.ready_delay_sec = readUnsigned(db, "ready_delay_sec", d.ready_delay_sec);
        }

        // ---------------------------
        // services
        // ---------------------------
        if (root["services"])
            m.services = root["services"].as<std::vector<std::string>>();
        m.service_settle_delay_sec = readUnsigned(root, "service_settle_delay_sec", m.service_settle_delay_sec);

        // ---------------------------
        // watcher
        // ---------------------------
        if (auto w = root["watcher"]) {
            auto& wi = m.watcher;
            wi.self_install = w["self_install"].as<bool>(wi.self_install);
            wi.name = w["name"].as<std::string>(wi.name);
            wi.description = w["description"].as<std::string>(wi.description);
            wi.unit_dir = w["unit_dir"].as<std::string>(wi.unit_dir);
            wi.working_dir = w["working_dir"].as<std::string>(wi.working_dir);
            wi.log_file = w["log_file"].as<std::string>(wi.log_file);
            wi.start_after_install = w["start_after_install"].as<bool>(wi.start_after_install);
        }
    } catch (const YAML::Exception& e) {
        return R::Error(ResultCode::InvalidArgument, e.what());
    }

    auto v = validate(m);
    if (!v) return R::Error(v.code(), v.error());
    return R::OK(std::move(m));
}

Result<void> TierManifestLoader::validate(const TierManifest& m) {
    if (m.services.empty())
        return Error(ResultCode::InvalidArgument, "no services to track");

    for (size_t i = 0; i < m.services.size(); ++i) {
        if (m.services[i].empty())
            return Error(ResultCode::InvalidArgument, fmt::format("service #{} has no name", i));
        for (size_t j = 0; j < i; ++j) {
            if (m.services[i] == m.services[j])
                return Error(ResultCode::AlreadyExists, fmt::format("service {} listed twice", m.services[i]));
        }
    }

    if (m.database.unit.empty())
        return Error(ResultCode::InvalidArgument, "database.unit is empty");
    if (m.database.probe_command.empty() || m.database.start_command.empty())
        return Error(ResultCode::InvalidArgument, "database probe/start command is empty");
    if (m.database.healthy_token.empty())
        return Error(ResultCode::InvalidArgument, "database.healthy_token is empty");

    const auto& name = m.watcher.name;
    const std::string suffix = ".service";
    if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
        return Error(ResultCode::InvalidArgument, fmt::format("watcher.name must end in {}: {}", suffix, name));
    if (name.find('/') != std::string::npos)
        return Error(ResultCode::InvalidArgument, fmt::format("watcher.name must not contain '/': {}", name));
    if (m.watcher.unit_dir.empty())
        return Error(ResultCode::InvalidArgument, "watcher.unit_dir is empty");

    return OK();
}

} // namespace manifest
