#pragma once
#include <string>

#include "service_manager.hpp"

namespace system_control {

// Text of the [Unit]/[Service]/[Install] file for `spec`.
std::string renderUnitFile(const UnitSpec& spec);

// Quotes one ExecStart argument when it needs it.
std::string quoteExecArg(const std::string& arg);

} // namespace system_control
