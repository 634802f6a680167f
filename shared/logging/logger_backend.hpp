#pragma once
#include <string>
#include <cstddef>
#include "result.h"
#include "logging_def.hpp"

namespace logging {

enum class SinkType { Console, File, RotatingFile, Syslog };

// One entry of a tag's `sinks:` list.
struct SinkSpec {
    SinkType type = SinkType::Console;
    std::string filename;                 // File, RotatingFile
    size_t max_size = 1048576;            // RotatingFile
    size_t max_files = 3;                 // RotatingFile
    std::string ident;                    // Syslog
};

// Tags are logger names. Sinks and levels set on GLOBAL_TAG apply to every
// tag registered afterwards.
class LoggerBackend {
public:
    virtual ~LoggerBackend() = default;
    virtual Result<void> init() = 0;
    virtual Result<void> shutdown() = 0;
    virtual Result<void> registerLogger(const std::string& tag) = 0;
    virtual Result<void> setLevel(const std::string& tag, Level level) = 0;
    virtual Result<void> setPattern(const std::string& pattern) = 0;
    virtual Result<void> addSink(const std::string& tag, const SinkSpec& sink) = 0;
    virtual Result<void> enableTag(const std::string& tag) = 0;
    virtual Result<void> disableTag(const std::string& tag) = 0;
    virtual void log(const std::string& tag, Level level, const std::string& msg) = 0;
};

} // namespace logging
