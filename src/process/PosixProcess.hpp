#pragma once
#include "process/Process.hpp"

namespace onionsite {

// fork/execvp child. The destructor kills and reaps a child that is still
// running, so a handle never leaks a zombie.
class PosixProcessHandle : public ProcessHandle {
public:
    explicit PosixProcessHandle(pid_t pid) : pid_(pid) {}
    ~PosixProcessHandle() override;

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    pid_t pid() const override { return pid_; }
    std::optional<ExitStatus> try_wait() override;
    ExitStatus wait() override;
    void kill() override;

private:
    pid_t pid_;
    std::optional<ExitStatus> status_;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> launch(const Command& cmd) override;
};

class PosixCommandRunner : public CommandRunner {
public:
    CommandResult run(const Command& cmd) override;
};

} // namespace onionsite
