#pragma once
#include <string>

namespace system_control {

// sd_notify messages to the supervising systemd.
// No-ops when not started by systemd (no $NOTIFY_SOCKET).
void notify_status(const std::string& msg);
void notify_stopping();

} // namespace system_control
