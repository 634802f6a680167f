#pragma once
#include "logging_def.hpp"
#include "logger.hpp"
#include <string>
#include <fmt/core.h>
#include <fmt/format.h>
#include <type_traits>
#include <utility>


namespace logging {

// Creates the backend and applies the `log:` section of `filename`.
inline Result<void> init(logging::Type logger_type, const std::string& filename) {
    auto r = Logger::instance().init(logger_type, filename);
    if (!r) return r;
    return Logger::instance().apply();
}

template <typename... Args>
inline void log(const char* tag, logging::Level level,
                fmt::format_string<Args...> fmt_str, Args&&... args) {
    auto& logger = Logger::instance();
    if (!logger.isInitialized()) return;
    logger.log(tag, level, fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace logging


// Free functions and main(): explicit tag.
template <typename... Args>
inline void LOG_DEBUG(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Debug, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_INFO(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Info, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_WARN(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Warn, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_ERROR(const char* tag, fmt::format_string<Args...> fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Error, fmt_str, std::forward<Args>(args)...);
}


// Member functions: the class's LOG_TAG.
#define LOGD(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Debug, __VA_ARGS__)
#define LOGI(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Info, __VA_ARGS__)
#define LOGW(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Warn, __VA_ARGS__)
#define LOGE(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Error, __VA_ARGS__)
