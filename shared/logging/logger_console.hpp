#pragma once
#include "result.h"
#include "logger_backend.hpp"
#include <cstdio>
#include <ctime>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace logging {

// Fallback when the configured sinks cannot be opened. Writes the same
// "<time> - [tag] [level] msg" lines as DEFAULT_PATTERN; errors go to stderr.
class ConsoleBackend : public LoggerBackend {
public:
    Result<void> init() override {
        std::lock_guard<std::mutex> lock(mutex_);
        global_level_ = Level::Info;
        return OK();
    }

    Result<void> shutdown() override {
        std::fflush(stdout);
        std::fflush(stderr);
        return OK();
    }

    Result<void> registerLogger(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tag_levels_.emplace(tag, global_level_);
        return OK();
    }

    Result<void> setLevel(const std::string& tag, Level level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tag == GLOBAL_TAG)
            global_level_ = level;
        else
            tag_levels_[tag] = level;
        return OK();
    }

    // fixed format
    Result<void> setPattern(const std::string&) override { return Error(ResultCode::NotSupported); }

    Result<void> addSink(const std::string& tag, const SinkSpec& sink) override {
        if (sink.type != SinkType::Console)
            return Error(ResultCode::NotSupported, "console backend writes to the terminal only");
        return enableTag(tag);
    }

    Result<void> enableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disabled_tags_.erase(tag);
        return OK();
    }

    Result<void> disableTag(const std::string& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disabled_tags_.insert(tag);
        return OK();
    }

    void log(const std::string& tag, Level level, const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disabled_tags_.count(tag)) return;

        auto it = tag_levels_.find(tag);
        if (level < (it != tag_levels_.end() ? it->second : global_level_)) return;

        std::FILE* out = (level >= Level::Error) ? stderr : stdout;
        fmt::print(out, "{:%Y-%m-%d %H:%M:%S} - [{}] [{}] {}\n",
                   fmt::localtime(std::time(nullptr)), tag, levelName(level), msg);
        std::fflush(out);
    }

private:
    // spdlog's names, so both backends read alike
    static const char* levelName(Level level) {
        switch (level) {
            case Level::Trace: return "trace";
            case Level::Debug: return "debug";
            case Level::Info:  return "info";
            case Level::Warn:  return "warning";
            case Level::Error: return "error";
            case Level::Fatal: return "critical";
            default:           return "off";
        }
    }

    std::mutex mutex_;
    Level global_level_ = Level::Info;
    std::unordered_map<std::string, Level> tag_levels_;
    std::unordered_set<std::string> disabled_tags_;
};

} // namespace logging
