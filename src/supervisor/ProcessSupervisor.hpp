#pragma once
#include <atomic>
#include <chrono>

#include "process/Process.hpp"
#include "runtime/ShutdownBroadcaster.hpp"

namespace onionsite {

struct SupervisorPolicy {
    int                       max_attempts{5};
    std::chrono::milliseconds backoff{3000};
    std::chrono::milliseconds poll_interval{200};  // exit-vs-shutdown race granularity
};

enum class SupervisorState { Idle, Launching, Running, Stopped, Failed };

const char* to_string(SupervisorState s);

// ---------------------------------------------------------------------------
// Keeps the helper process alive within a restart budget.
//
//   Idle -> Launching -> Running -> (exit) -> backoff -> Launching ...
//                                 -> (shutdown) -> kill, reap -> Stopped
//   Launching with attempts == max_attempts -> fire shutdown -> Failed
//
// Any exit, including exit status 0, is unexpected for a process meant to
// run forever and costs one attempt. A launch failure (binary missing,
// permissions) costs one attempt as well, after the same backoff. The
// attempt counter never resets. Shutdown observed while running kills the
// helper with SIGKILL and reaps it before reporting Stopped; shutdown
// observed during a backoff also ends in Stopped.
//
// The supervisor is the only owner of the helper: exactly one handle exists
// at a time, and it is gone (reaped) when run() returns.
// ---------------------------------------------------------------------------
class ProcessSupervisor {
public:
    ProcessSupervisor(ProcessLauncher& launcher,
                      Command command,
                      ShutdownBroadcaster& shutdown,
                      SupervisorPolicy policy = {});

    // Blocks until Stopped or Failed and returns that state.
    SupervisorState run();

    SupervisorState state() const { return state_.load(); }
    int attempts() const { return attempts_.load(); }

private:
    void transition(SupervisorState next);

    // Runs one helper until it exits (true) or shutdown arrives (false).
    bool supervise(ProcessHandle& child);

    ProcessLauncher&                  launcher_;
    Command                           command_;
    ShutdownBroadcaster&              shutdown_;
    ShutdownBroadcaster::Subscription stop_;
    SupervisorPolicy                  policy_;
    std::atomic<int>                  attempts_{0};
    std::atomic<SupervisorState>      state_{SupervisorState::Idle};
};

} // namespace onionsite
