#pragma once
#include <sys/types.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace onionsite {

struct Command {
    std::string program;
    std::vector<std::string> args;

    std::string to_string() const;
};

// How a child ended, as reported by waitpid().
struct ExitStatus {
    enum class Kind { Exited, Signaled };

    Kind kind = Kind::Exited;
    int  code = 0;  // exit code, or signal number when Signaled

    static ExitStatus from_wait_status(int status);

    bool success() const { return kind == Kind::Exited && code == 0; }
    std::string to_string() const;
};

// The program could not be started at all (fork failed, binary missing,
// not executable). Distinct from a started program exiting non-zero.
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& what)
        : std::runtime_error(what) {}
};

// One running child. Owned by exactly one caller; not thread-safe.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual pid_t pid() const = 0;

    // Non-blocking reap. Empty while the child is still running.
    virtual std::optional<ExitStatus> try_wait() = 0;

    // Blocking reap.
    virtual ExitStatus wait() = 0;

    // SIGKILL. No-op once the child has been reaped.
    virtual void kill() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Throws LaunchError.
    virtual std::unique_ptr<ProcessHandle> launch(const Command& cmd) = 0;
};

struct CommandResult {
    ExitStatus  status;
    std::string output;  // captured stdout
};

// Runs a short-lived command to completion and captures its stdout.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Throws LaunchError, or std::system_error if reading the output fails.
    virtual CommandResult run(const Command& cmd) = 0;
};

} // namespace onionsite
