#pragma once
#include <string>
#include <functional>
#include <memory>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

// Process-wide logger. Until init() succeeds every log call is dropped.
//
//   log:
//     "*":                      # global: level, pattern, sinks
//       level: info
//       sinks: [{type: file, filename: /var/log/tierwatch-trail.log}]
//     systemctl:                # per tag: level, sinks
//       level: debug
class Logger {
public:
    static Logger& instance();

    // Loads `filename` and keeps its `log:` section for apply().
    Result<void> init(logging::Type logger, const std::string& filename);
    Result<void> init(logging::Type logger, const YAML::Node& config);

    // Applies the kept section. A bad entry does not stop the others; the
    // last failure is returned.
    Result<void> apply();
    Result<void> shutdown();

    void log(const std::string& tag, Level level, const std::string& msg) { if (logger_) logger_->log(tag, level, msg); }

    Result<void> setLevel(const std::string& tag, Level level) {
        if (logger_) return logger_->setLevel(tag, level);
        return Error(ResultCode::InvalidState, "logger not initialized");
    }
    Result<void> enableTag(const std::string& tag) {
        if (logger_) return logger_->enableTag(tag);
        return Error(ResultCode::InvalidState, "logger not initialized");
    }
    Result<void> disableTag(const std::string& tag) {
        if (logger_) return logger_->disableTag(tag);
        return Error(ResultCode::InvalidState, "logger not initialized");
    }

    bool isInitialized() const noexcept { return logger_ != nullptr; }

    static logging::Level toLevel(const std::string& s);
    static Result<SinkSpec> parseSink(const YAML::Node& sink);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> createBackend(logging::Type logger_type);
    Result<void> applyTag(const std::string& tag, const YAML::Node& node, const std::function<void(Result<void>)>& keep);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
