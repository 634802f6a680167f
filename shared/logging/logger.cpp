#include "logger.hpp"
#include "logger_spdlog.hpp"
#include "logger_console.hpp"
#include <fmt/core.h>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // thread-safe since C++11
    return instance;
}

Logger::~Logger() {
    if (logger_) logger_->shutdown();
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::BadFile& e) {
        return Error(ResultCode::NotFound, fmt::format("log config {}: {}", filename, e.what()));
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("log config {}: {}", filename, e.what()));
    }
    return init(logger_type, root);
}

Result<void> Logger::init(logging::Type logger_type, const YAML::Node& config) {
    config_ = config;
    return createBackend(logger_type);
}

Result<void> Logger::createBackend(logging::Type logger_type) {
    if (logger_) {
        auto r = logger_->shutdown();
        if (!r) return r;
        logger_.reset();
    }

    switch (logger_type) {
        case logging::Type::SpdLog:
            logger_ = std::make_shared<SpdlogBackend>();
            break;
        case logging::Type::Console:
            logger_ = std::make_shared<ConsoleBackend>();
            break;
        default:
            return Error(ResultCode::NotSupported, "unknown logger type");
    }

    return logger_->init();
}

Result<void> Logger::shutdown() {
    if (!logger_) return OK();
    auto r = logger_->shutdown();
    logger_.reset();
    return r;
}

logging::Level Logger::toLevel(const std::string& s) {
    if (s == "trace") return logging::Level::Trace;
    if (s == "debug") return logging::Level::Debug;
    if (s == "info")  return logging::Level::Info;
    if (s == "warn")  return logging::Level::Warn;
    if (s == "error") return logging::Level::Error;
    if (s == "fatal") return logging::Level::Fatal;
    return logging::Level::Off;
}

Result<SinkSpec> Logger::parseSink(const YAML::Node& sink) {
    using R = Result<SinkSpec>;
    if (!sink.IsMap() || !sink["type"])
        return R::Error(ResultCode::InvalidArgument, "sink without type");

    SinkSpec spec;
    const auto type = sink["type"].as<std::string>();
    if (type == "console") {
        spec.type = SinkType::Console;
    } else if (type == "file" || type == "rotating_file") {
        spec.type = type == "file" ? SinkType::File : SinkType::RotatingFile;
        if (!sink["filename"])
            return R::Error(ResultCode::InvalidArgument, fmt::format("{} sink without filename", type));
        spec.filename = sink["filename"].as<std::string>();
        spec.max_size = sink["max_size"].as<size_t>(spec.max_size);
        spec.max_files = sink["max_files"].as<size_t>(spec.max_files);
    } else if (type == "syslog") {
        spec.type = SinkType::Syslog;
        spec.ident = sink["ident"].as<std::string>(DEFAULT_TAG);
    } else {
        return R::Error(ResultCode::NotSupported, fmt::format("unknown sink type: {}", type));
    }
    return R::OK(std::move(spec));
}

Result<void> Logger::applyTag(const std::string& tag, const YAML::Node& node,
                              const std::function<void(Result<void>)>& keep) {
    const bool global = (tag == GLOBAL_TAG);

    if (node["level"]) {
        auto name = node["level"].as<std::string>();
        auto level = toLevel(name);
        if (level == Level::Off && name != "off")
            keep(Error(ResultCode::InvalidArgument, fmt::format("{}: unknown level '{}'", tag, name)));
        else
            keep(logger_->setLevel(tag, level));
    }
    if (global && node["pattern"]) {
        keep(logger_->setPattern(node["pattern"].as<std::string>()));
    }
    for (const auto& entry : node["sinks"]) {
        auto spec = parseSink(entry);
        if (!spec) {
            keep(Error(spec.code(), fmt::format("{}: {}", tag, spec.message())));
            continue;
        }
        if (spec.value().type == SinkType::Syslog && !entry["ident"])
            spec.value().ident = global ? DEFAULT_TAG : tag;
        keep(logger_->addSink(tag, spec.value()));
    }

    if (global) return OK();
    return logger_->registerLogger(tag);
}

Result<void> Logger::apply() {
    if (!logger_) return Error(ResultCode::InvalidState, "logger not initialized");
    if (!config_["log"]) return OK();

    // an unsupported sink on the fallback backend is not an error
    Result<void> result = OK();
    auto keep = [&result](Result<void> r) {
        if (!r && r.code() != ResultCode::NotSupported) result = std::move(r);
    };

    try {
        const auto g_tag = std::string(GLOBAL_TAG);
        auto log_node = config_["log"];

        // global first: tags registered below pick up its sinks
        if (log_node[g_tag])
            keep(applyTag(g_tag, log_node[g_tag], keep));

        for (auto it : log_node) {
            auto tag = it.first.as<std::string>();
            if (tag == g_tag) continue;
            keep(applyTag(tag, it.second, keep));
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("log section: {}", e.what()));
    }

    return result;
}

} // namespace logging
