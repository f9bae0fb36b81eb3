#pragma once
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace onionsite {

// Runs one io_context on a fixed set of worker threads. Listener sessions,
// the accept loops and the signal forwarder are all cooperative tasks on
// this context; any of them may run on any worker.
class WorkerPool {
public:
    // threads == 0 picks hardware concurrency, never fewer than 2.
    explicit WorkerPool(std::size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::io_context& context() { return ioc_; }

    void start();

    // Drops the work guard, stops the context and joins every worker.
    void stop();

    bool running() const { return !workers_.empty(); }
    std::size_t size() const { return threads_; }

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context ioc_;
    std::optional<WorkGuard> guard_;
    std::size_t threads_;
    std::vector<std::thread> workers_;
};

} // namespace onionsite
