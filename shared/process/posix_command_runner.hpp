#pragma once
#include "command_runner.hpp"

namespace process {

// fork/execvp with a pipe carrying the child's stdout+stderr.
class PosixCommandRunner : public CommandRunner {
public:
    PosixCommandRunner() = default;

    Result<CommandOutput> run(const std::vector<std::string>& argv) override;

    inline static constexpr const char* LOG_TAG = "CommandRunner";

    // exit status reported by the child when execvp fails
    static constexpr int EXEC_FAILED = 127;
};

} // namespace process
