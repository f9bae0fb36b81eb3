#include "discovery/AddressDiscoveryTask.hpp"
#include "discovery/OnionAddress.hpp"
#include "discovery/SharedAddressCell.hpp"

#include <iostream>
#include <thread>

using namespace onionsite;

AddressDiscoveryTask::AddressDiscoveryTask(std::shared_ptr<CommandRunner> runner,
                                           Command query,
                                           std::shared_ptr<SharedAddressCell> cell,
                                           DiscoveryPolicy policy)
    : runner_(std::move(runner)),
      query_(std::move(query)),
      cell_(std::move(cell)),
      policy_(policy) {}

void AddressDiscoveryTask::spawn(std::shared_ptr<AddressDiscoveryTask> task) {
    std::thread([task]() { task->run(); }).detach();
}

bool AddressDiscoveryTask::run() {
    std::this_thread::sleep_for(policy_.initial_delay);

    const auto deadline = std::chrono::steady_clock::now() + policy_.timeout;

    for (;;) {
        if (attempt()) return true;

        if (std::chrono::steady_clock::now() >= deadline) {
            std::cout << "[DISCOVERY] No onion address after " << attempts_
                      << " attempts, giving up; address stays unknown\n";
            return false;
        }
        std::this_thread::sleep_for(policy_.retry_interval);
    }
}

bool AddressDiscoveryTask::attempt() {
    ++attempts_;

    CommandResult result;
    try {
        result = runner_->run(query_);
    } catch (const std::exception& e) {
        std::cerr << "[DISCOVERY] Query failed (attempt " << attempts_ << "): "
                  << e.what() << "\n";
        return false;
    }

    if (!result.status.success()) {
        std::cout << "[DISCOVERY] Query " << result.status.to_string()
                  << " (attempt " << attempts_ << ")\n";
        return false;
    }

    auto address = find_onion_address(result.output);
    if (!address) {
        std::cout << "[DISCOVERY] No onion address in query output (attempt "
                  << attempts_ << ")\n";
        return false;
    }

    if (cell_->set(*address)) {
        std::cout << "[DISCOVERY] Onion address: " << *address << "\n";
    }
    return true;
}
