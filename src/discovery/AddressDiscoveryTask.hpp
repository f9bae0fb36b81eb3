#pragma once
#include <chrono>
#include <memory>

#include "process/Process.hpp"

namespace onionsite {

class SharedAddressCell;

struct DiscoveryPolicy {
    std::chrono::milliseconds initial_delay{2000};   // let the helper boot
    std::chrono::milliseconds timeout{30000};        // measured after initial_delay
    std::chrono::milliseconds retry_interval{5000};
};

// ---------------------------------------------------------------------------
// Polls the helper's address query until it prints an onion address, then
// publishes it into the SharedAddressCell exactly once.
//
//   sleep(initial_delay); deadline = now + timeout
//   loop: run query -> exit 0 and a matching line? publish, done
//         otherwise: past deadline? give up, else sleep(retry_interval)
//
// The deadline is only checked between attempts. A slow query that returns
// a match after the deadline still publishes. There is no cancellation:
// the task ends on success or on its own deadline. Giving up is not an
// error anywhere else; the address simply stays unknown for this run.
// ---------------------------------------------------------------------------
class AddressDiscoveryTask {
public:
    AddressDiscoveryTask(std::shared_ptr<CommandRunner> runner,
                         Command query,
                         std::shared_ptr<SharedAddressCell> cell,
                         DiscoveryPolicy policy = {});

    // Blocking. Returns true if an address was found.
    bool run();

    // Fire-and-forget: runs on a detached thread that shares ownership of
    // the task, its runner and the cell. Nobody joins it. If the process
    // exits mid-run the thread only touches what it co-owns and the standard
    // streams, which are never destroyed.
    static void spawn(std::shared_ptr<AddressDiscoveryTask> task);

    int attempts() const { return attempts_; }

private:
    bool attempt();

    std::shared_ptr<CommandRunner>     runner_;
    Command                            query_;
    std::shared_ptr<SharedAddressCell> cell_;
    DiscoveryPolicy                    policy_;
    int                                attempts_{0};
};

} // namespace onionsite
