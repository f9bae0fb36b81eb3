#include "runtime/ShutdownBroadcaster.hpp"

using namespace onionsite;

ShutdownBroadcaster::ShutdownBroadcaster()
    : state_(std::make_shared<State>()) {}

bool ShutdownBroadcaster::fire() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mtx);
        if (state_->fired) return false;
        state_->fired = true;
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();

    // Outside the lock: callbacks may subscribe or query fired().
    for (auto& fn : callbacks) fn();
    return true;
}

bool ShutdownBroadcaster::fired() const {
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->fired;
}

ShutdownBroadcaster::Subscription ShutdownBroadcaster::subscribe() const {
    return Subscription(state_);
}

bool ShutdownBroadcaster::Subscription::fired() const {
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->fired;
}

void ShutdownBroadcaster::Subscription::wait() const {
    std::unique_lock<std::mutex> lock(state_->mtx);
    state_->cv.wait(lock, [this] { return state_->fired; });
}

bool ShutdownBroadcaster::Subscription::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mtx);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->fired; });
}

void ShutdownBroadcaster::Subscription::on_fire(std::function<void()> fn) const {
    {
        std::lock_guard<std::mutex> lock(state_->mtx);
        if (!state_->fired) {
            state_->callbacks.push_back(std::move(fn));
            return;
        }
    }
    fn();
}
