#pragma once

#include <memory>

#include "discovery/SharedAddressCell.hpp"
#include "runtime/Config.hpp"
#include "runtime/ShutdownBroadcaster.hpp"

namespace onionsite {

// Single owner of the process-wide state. Constructed once in main() and
// handed to the Orchestrator by reference.
struct Context {
    Config config;

    // Fired by a signal, by the supervisor giving up, or by a listener
    // failing. Every long-lived component subscribes.
    ShutdownBroadcaster shutdown;

    // Written once by discovery, read by public request handlers. Shared
    // because the detached discovery thread may outlive Context.
    std::shared_ptr<SharedAddressCell> onion_address;

    explicit Context(Config cfg)
        : config(std::move(cfg)),
          onion_address(std::make_shared<SharedAddressCell>()) {}
};

} // namespace onionsite
