#include "unit_file.hpp"

#include <fmt/core.h>

namespace system_control {

namespace {

constexpr const char* UNIT_TEMPLATE =
R"([Unit]
Description={description}
After=network.target
Wants=network-online.target

[Service]
Type=simple
User=root
Group=root
WorkingDirectory={working_dir}
ExecStart={exec_start}
Restart=no
TimeoutSec=0
NotifyAccess=main
StandardOutput=append:{log_path}
StandardError=append:{log_path}

[Install]
WantedBy=multi-user.target
)";

// systemd expands %specifiers everywhere in a unit file
std::string escapeSpecifiers(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '%') out += '%';
        out += c;
    }
    return out;
}

} // namespace

std::string quoteExecArg(const std::string& arg) {
    std::string escaped;
    bool needs_quotes = arg.empty();
    for (char c : arg) {
        switch (c) {
            case '"':  escaped += "\\\""; needs_quotes = true; break;
            case '\\': escaped += "\\\\"; needs_quotes = true; break;
            case '$':  escaped += "$$"; break;
            case '%':  escaped += "%%"; break;
            case ' ':
            case '\t':
            case ';':
            case '\'': escaped += c; needs_quotes = true; break;
            default:   escaped += c;
        }
    }
    return needs_quotes ? "\"" + escaped + "\"" : escaped;
}

std::string renderUnitFile(const UnitSpec& spec) {
    std::string exec_start = quoteExecArg(spec.exec_path);
    for (const auto& a : spec.exec_args) {
        exec_start += ' ';
        exec_start += quoteExecArg(a);
    }

    return fmt::format(fmt::runtime(UNIT_TEMPLATE),
        fmt::arg("description", escapeSpecifiers(spec.description)),
        fmt::arg("working_dir", escapeSpecifiers(spec.working_dir)),
        fmt::arg("exec_start", exec_start),
        fmt::arg("log_path", escapeSpecifiers(spec.log_path)));
}

} // namespace system_control
