#include "runtime/WorkerPool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

using namespace onionsite;

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(threads ? threads
                       : std::max<std::size_t>(2, std::thread::hardware_concurrency())) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (!workers_.empty()) return;  // already running
    if (ioc_.stopped()) ioc_.restart();
    guard_.emplace(boost::asio::make_work_guard(ioc_));

    workers_.reserve(threads_);
    for (std::size_t i = 0; i < threads_; ++i) {
        workers_.emplace_back([this, i]() {
            // A handler that throws must not take the whole pool down.
            for (;;) {
                try {
                    ioc_.run();
                    return;
                } catch (const std::exception& e) {
                    std::cerr << "[POOL] worker " << i << " handler threw: "
                              << e.what() << "\n";
                }
            }
        });
    }
}

void WorkerPool::stop() {
    if (workers_.empty()) return;
    guard_.reset();
    ioc_.stop();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}
