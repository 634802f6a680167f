#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace manifest {
// ---------------------------
// Database tier
// ---------------------------
struct DatabaseInfo {
    std::string unit = "sapinit";         // unit hosting the database control process
    std::string run_as = "hdbadm";        // empty: run commands as the current user
    std::string probe_command = "sapcontrol -nr 00 -function GetProcessList";
    std::string start_command = "sapcontrol -nr 00 -function Start";
    std::string healthy_token = "GREEN";  // case-sensitive substring of the probe output
    uint32_t max_retries = 20;            // health polls after the first one
    uint32_t retry_interval_sec = 20;
    uint32_t settle_delay_sec = 30;       // after starting `unit`, before the first probe
    uint32_t ready_delay_sec = 30;        // after the database turned healthy, before services
};

// ---------------------------
// Persistent watcher registration
// ---------------------------
inline constexpr const char* DEFAULT_WATCHER_LOG = "tierwatch.log";

struct WatcherInfo {
    bool self_install = true;
    std::string name = "tierwatch.service";
    std::string description = "Database tier and application services check and start";
    std::string unit_dir = "/etc/systemd/system";
    std::string working_dir;              // empty: directory of the executable
    std::string log_file;                 // empty: <working_dir>/tierwatch.log
    bool start_after_install = false;
};

// ---------------------------
// Whole manifest
// ---------------------------
struct TierManifest {
    std::string source;                   // absolute path it was loaded from
    DatabaseInfo database;
    std::vector<std::string> services;    // start order
    uint32_t service_settle_delay_sec = 5;
    WatcherInfo watcher;
};

} // namespace manifest
