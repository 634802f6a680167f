#include "posix_command_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

#include "logging.hpp"

namespace process {

std::string joinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

Result<CommandOutput> PosixCommandRunner::run(const std::vector<std::string>& argv) {
    using R = Result<CommandOutput>;

    if (argv.empty() || argv.front().empty())
        return R::Error(ResultCode::InvalidArgument, "empty command");

    // built before fork: the child makes async-signal-safe calls only
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& s : argv) args.push_back(const_cast<char*>(s.c_str()));
    args.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0)
        return R::Error(ResultCode::InternalError, fmt::format("pipe: {}", std::strerror(errno)));

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return R::Error(ResultCode::InternalError, fmt::format("fork: {}", std::strerror(err)));
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }

        ::execvp(args[0], args.data());
        ::_exit(EXEC_FAILED);
    }

    ::close(fds[1]);

    CommandOutput out;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            out.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(fds[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0)
        return R::Error(ResultCode::InternalError, fmt::format("waitpid: {}", std::strerror(errno)));

    if (WIFEXITED(status))
        out.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        out.exit_code = 128 + WTERMSIG(status);

    LOG_DEBUG(LOG_TAG, "'{}' exited with {}", joinArgv(argv), out.exit_code);
    return R::OK(std::move(out));
}

} // namespace process
