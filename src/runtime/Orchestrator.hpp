#pragma once
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <functional>
#include <memory>

#include "discovery/AddressDiscoveryTask.hpp"
#include "process/Process.hpp"
#include "supervisor/ProcessSupervisor.hpp"

namespace onionsite {

struct Context;

// ---------------------------------------------------------------------------
// Wires the service together and decides the process outcome.
//
//   1. bind loopback (onion) and public listeners       -> StartupError
//   2. spawn address discovery, fire-and-forget
//   3. start worker pool + signal forwarder
//   4. start the helper supervisor on its own thread
//   5. serve both listeners until shutdown, then join the supervisor
//
// Outcome: a listener runtime error wins. Shutdown is fired so the other
// listener drains and the supervisor kills the helper; the supervisor is
// still joined and its state logged before the listener error is thrown.
// With both listeners clean the supervisor decides: Stopped returns
// normally, Failed (or a supervisor that threw) is a RuntimeError.
// ---------------------------------------------------------------------------
class Orchestrator {
public:
    using tcp = boost::asio::ip::tcp;
    using ReadyCallback = std::function<void(const tcp::endpoint& onion, const tcp::endpoint& pub)>;

    Orchestrator(Context& ctx,
                 ProcessLauncher& launcher,
                 std::shared_ptr<CommandRunner> runner);

    void set_supervisor_policy(const SupervisorPolicy& p) { supervisor_policy_ = p; }
    void set_discovery_policy(const DiscoveryPolicy& p) { discovery_policy_ = p; }
    void set_worker_threads(std::size_t n) { worker_threads_ = n; }
    void set_handle_signals(bool on) { handle_signals_ = on; }

    // Called once both listeners are bound, before serving starts.
    void on_ready(ReadyCallback cb) { on_ready_ = std::move(cb); }

    // Blocks for the lifetime of the service. Throws StartupError or
    // RuntimeError.
    void run();

private:
    Context&                       ctx_;
    ProcessLauncher&               launcher_;
    std::shared_ptr<CommandRunner> runner_;
    SupervisorPolicy               supervisor_policy_;
    DiscoveryPolicy                discovery_policy_;
    std::size_t                    worker_threads_{0};
    bool                           handle_signals_{true};
    ReadyCallback                  on_ready_;
};

} // namespace onionsite
