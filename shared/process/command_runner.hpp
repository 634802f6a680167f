#pragma once
#include <string>
#include <vector>

#include "result.h"

namespace process {

struct CommandOutput {
    int exit_code = -1;
    std::string output;     // stdout and stderr, merged

    bool succeeded() const noexcept { return exit_code == 0; }
};

// Runs an external program to completion.
// An error Result means the program could not be run at all; a program that
// ran and exited non-zero is still a value.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<CommandOutput> run(const std::vector<std::string>& argv) = 0;
};

std::string joinArgv(const std::vector<std::string>& argv);

} // namespace process
