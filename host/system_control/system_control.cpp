#include "system_control.hpp"

#include <cstring>
#include <systemd/sd-daemon.h>

#include "logging.hpp"

namespace system_control {

namespace {

constexpr const char* TAG = "sd_notify";

// one assignment per line in the notify protocol
void send(std::string state) {
    for (auto& c : state)
        if (c == '\n') c = ' ';

    int r = sd_notify(0, state.c_str());
    if (r < 0)
        LOG_DEBUG(TAG, "'{}' not delivered: {}", state, std::strerror(-r));
}

} // namespace

void notify_status(const std::string& msg) {
    send("STATUS=" + msg);
}

void notify_stopping() {
    send("STOPPING=1");
}

} // namespace system_control
