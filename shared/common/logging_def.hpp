#pragma once
#include <string_view>

namespace logging {

enum class Type { SpdLog, Console };
enum class Level { Trace, Debug, Info, Warn, Error, Fatal, Off };

// `log:` key whose settings every tag inherits
inline constexpr std::string_view GLOBAL_TAG = "*";

// syslog ident when the global sink names none
inline constexpr const char* DEFAULT_TAG = "tierwatch";

// "2024-01-01 08:00:00 - [database] [info] Database is online"
inline constexpr const char* DEFAULT_PATTERN = "%Y-%m-%d %H:%M:%S - [%n] [%l] %v";

} // namespace logging
