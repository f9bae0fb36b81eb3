#include "supervisor/ProcessSupervisor.hpp"

#include <iostream>

using namespace onionsite;

const char* onionsite::to_string(SupervisorState s) {
    switch (s) {
        case SupervisorState::Idle:      return "IDLE";
        case SupervisorState::Launching: return "LAUNCHING";
        case SupervisorState::Running:   return "RUNNING";
        case SupervisorState::Stopped:   return "STOPPED";
        case SupervisorState::Failed:    return "FAILED";
    }
    return "UNKNOWN";
}

ProcessSupervisor::ProcessSupervisor(ProcessLauncher& launcher,
                                     Command command,
                                     ShutdownBroadcaster& shutdown,
                                     SupervisorPolicy policy)
    : launcher_(launcher),
      command_(std::move(command)),
      shutdown_(shutdown),
      stop_(shutdown.subscribe()),
      policy_(policy) {}

void ProcessSupervisor::transition(SupervisorState next) {
    state_.store(next);
}

SupervisorState ProcessSupervisor::run() {
    for (;;) {
        transition(SupervisorState::Launching);

        if (attempts_.load() >= policy_.max_attempts) {
            std::cerr << "[SUPERVISOR] Restart budget exhausted after "
                      << attempts_.load() << " attempts, requesting shutdown\n";
            transition(SupervisorState::Failed);
            shutdown_.fire();
            return SupervisorState::Failed;
        }

        if (stop_.fired()) {
            std::cout << "[SUPERVISOR] Shutdown before launch\n";
            transition(SupervisorState::Stopped);
            return SupervisorState::Stopped;
        }

        std::unique_ptr<ProcessHandle> child;
        try {
            child = launcher_.launch(command_);
        } catch (const LaunchError& e) {
            std::cerr << "[SUPERVISOR] Launch failed (attempt " << attempts_.load() + 1
                      << "/" << policy_.max_attempts << "): " << e.what()
                      << ", retrying in " << policy_.backoff.count() << "ms\n";
        }

        if (child) {
            std::cout << "[SUPERVISOR] Spawned " << command_.to_string()
                      << " PID=" << child->pid() << "\n";
            transition(SupervisorState::Running);

            if (!supervise(*child)) {
                transition(SupervisorState::Stopped);
                return SupervisorState::Stopped;
            }
        }

        if (stop_.wait_for(policy_.backoff)) {
            std::cout << "[SUPERVISOR] Shutdown during backoff\n";
            transition(SupervisorState::Stopped);
            return SupervisorState::Stopped;
        }
        attempts_.fetch_add(1);
    }
}

bool ProcessSupervisor::supervise(ProcessHandle& child) {
    for (;;) {
        if (auto status = child.try_wait()) {
            std::cerr << "[SUPERVISOR] Helper PID=" << child.pid() << " "
                      << status->to_string() << ", restarting in "
                      << policy_.backoff.count() << "ms\n";
            return true;
        }

        if (stop_.wait_for(policy_.poll_interval)) {
            std::cout << "[SUPERVISOR] Shutdown requested, killing PID="
                      << child.pid() << "\n";
            child.kill();
            ExitStatus status = child.wait();
            std::cout << "[SUPERVISOR] Helper reaped: " << status.to_string() << "\n";
            return false;
        }
    }
}
