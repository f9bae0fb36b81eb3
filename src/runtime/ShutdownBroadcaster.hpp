#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace onionsite {

// ---------------------------------------------------------------------------
// One-shot, multi-subscriber shutdown notification.
//
// fire() may be called from any thread, any number of times. Only the first
// call has an effect: every subscription resolves, and every callback
// registered through on_fire() runs exactly once. Subscribing after the
// broadcaster fired yields a subscription that is already resolved, so late
// subscribers never miss the event.
//
// Producers: SignalForwarder (SIGINT/SIGTERM), ProcessSupervisor (restart
// budget exhausted), Orchestrator (listener runtime error).
// Consumers: both Listeners, ProcessSupervisor.
// ---------------------------------------------------------------------------
class ShutdownBroadcaster {
    struct State {
        mutable std::mutex mtx;
        std::condition_variable cv;
        bool fired{false};
        std::vector<std::function<void()>> callbacks;
    };

public:
    class Subscription {
    public:
        bool fired() const;

        // Blocks until the broadcaster fires.
        void wait() const;

        // Returns true if the broadcaster fired within the timeout.
        bool wait_for(std::chrono::milliseconds timeout) const;

        // Runs fn exactly once: on the firing thread, or inline right now
        // if the broadcaster already fired.
        void on_fire(std::function<void()> fn) const;

    private:
        friend class ShutdownBroadcaster;
        explicit Subscription(std::shared_ptr<State> state)
            : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    ShutdownBroadcaster();

    ShutdownBroadcaster(const ShutdownBroadcaster&) = delete;
    ShutdownBroadcaster& operator=(const ShutdownBroadcaster&) = delete;

    // Idempotent. Returns true only for the call that actually fired.
    bool fire();
    bool fired() const;

    Subscription subscribe() const;

private:
    std::shared_ptr<State> state_;
};

} // namespace onionsite
