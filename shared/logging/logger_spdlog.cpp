#include "logger_spdlog.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <fmt/core.h>
#include <memory>


namespace logging {


SpdlogBackend::~SpdlogBackend() {
    shutdown();
}

spdlog::level::level_enum SpdlogBackend::toSpd_(Level lvl) {
    switch (lvl) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        case Level::Off:   return spdlog::level::off;
    }
    return spdlog::level::off;
}

Result<spdlog::sink_ptr> SpdlogBackend::makeSink_(const SinkSpec& sink) {
    using R = Result<spdlog::sink_ptr>;
    try {
        switch (sink.type) {
            case SinkType::Console:
                return R::OK(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            case SinkType::File:
                // append: the trail spans every run
                return R::OK(std::make_shared<spdlog::sinks::basic_file_sink_mt>(sink.filename, false));
            case SinkType::RotatingFile:
                return R::OK(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    sink.filename, sink.max_size, sink.max_files));
            case SinkType::Syslog:
                return R::OK(std::make_shared<spdlog::sinks::syslog_sink_mt>(sink.ident, LOG_PID, LOG_USER, true));
        }
    } catch (const spdlog::spdlog_ex& e) {
        return R::Error(ResultCode::PermissionDenied, fmt::format("sink {}: {}", sink.filename, e.what()));
    }
    return R::Error(ResultCode::NotSupported, "unknown sink type");
}

Result<void> SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::set_pattern(pattern_);
    initialized_ = true;
    return OK();
}

Result<void> SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return OK();
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    spdlog::drop_all();
    tags_.clear();
    initialized_ = false;
    return OK();
}

Result<void> SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registerLoggerLocked_(tag);
}

Result<void> SpdlogBackend::registerLoggerLocked_(const std::string& tag) {
    if (spdlog::get(tag)) return DuplicateIgnored();

    std::vector<spdlog::sink_ptr> sinks;
    Level level = global_level_;

    auto own = tags_.find(tag);
    if (own != tags_.end()) {
        sinks = own->second.sinks;
        if (own->second.level) level = *own->second.level;
    }
    auto global = tags_.find(std::string(GLOBAL_TAG));
    if (global != tags_.end())
        sinks.insert(sinks.end(), global->second.sinks.begin(), global->second.sinks.end());

    if (sinks.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    logger->set_level(toSpd_(level));
    logger->set_pattern(pattern_);
    // the trail must survive an abrupt exit
    logger->flush_on(spdlog::level::info);

    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::AlreadyExists, e.what());
    }
    return OK();
}

Result<void> SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        return OK();
    }
    tags_[tag].level = level;
    if (auto logger = spdlog::get(tag))
        logger->set_level(toSpd_(level));
    return OK();
}

Result<void> SpdlogBackend::setPattern(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pattern.empty()) return Error(ResultCode::InvalidArgument, "empty log pattern");
    pattern_ = pattern;
    spdlog::set_pattern(pattern_);
    return OK();
}

// Takes effect for loggers registered after the call.
Result<void> SpdlogBackend::addSink(const std::string& tag, const SinkSpec& sink) {
    auto s = makeSink_(sink);
    if (!s) return Result<void>::from(s);

    std::lock_guard<std::mutex> lock(mutex_);
    tags_[tag].sinks.push_back(std::move(s.value()));
    return OK();
}

Result<void> SpdlogBackend::enableTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    disabled_tags_.erase(tag);
    return OK();
}

Result<void> SpdlogBackend::disableTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    disabled_tags_.insert(tag);
    return OK();
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || disabled_tags_.count(tag)) return;

        logger = spdlog::get(tag);
        if (!logger) {
            if (!registerLoggerLocked_(tag)) return;
            logger = spdlog::get(tag);
        }
    }
    if (!logger) return;

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal)
        logger->flush();
}


} // namespace logging
