#pragma once
#include "result.h"
#include "logger_backend.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <mutex>


namespace logging {

// One spdlog logger per tag, built lazily on first use from the tag's own
// sinks plus the global ones.
class SpdlogBackend : public LoggerBackend {
public:
    SpdlogBackend() = default;
    ~SpdlogBackend() override;

    Result<void> init() override;
    Result<void> shutdown() override;
    Result<void> registerLogger(const std::string& tag) override;
    Result<void> setLevel(const std::string& tag, Level lvl) override;
    Result<void> setPattern(const std::string& pattern) override;
    Result<void> addSink(const std::string& tag, const SinkSpec& sink) override;
    Result<void> enableTag(const std::string& tag) override;
    Result<void> disableTag(const std::string& tag) override;
    void log(const std::string& tag, Level level, const std::string& msg) override;

private:
    struct TagConfig {
        std::optional<Level> level;       // unset: global level
        std::vector<spdlog::sink_ptr> sinks;
    };

    static spdlog::level::level_enum toSpd_(Level lvl);
    static Result<spdlog::sink_ptr> makeSink_(const SinkSpec& sink);

    Result<void> registerLoggerLocked_(const std::string& tag);

    bool initialized_ = false;
    std::unordered_map<std::string, TagConfig> tags_;
    std::unordered_set<std::string> disabled_tags_;
    std::mutex mutex_;

    Level global_level_ = Level::Info;
    std::string pattern_ = DEFAULT_PATTERN;
};

} // namespace logging
