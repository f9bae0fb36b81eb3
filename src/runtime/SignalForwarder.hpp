#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>

namespace onionsite {

class ShutdownBroadcaster;

// Turns SIGINT and SIGTERM into a ShutdownBroadcaster firing. The handler
// runs on the worker pool, never in signal context. Keeps listening after
// the first signal so repeated Ctrl-C is logged instead of killing us.
class SignalForwarder {
public:
    SignalForwarder(boost::asio::io_context& ioc, ShutdownBroadcaster& shutdown);
    ~SignalForwarder();

    // Not synchronised with the handler: call once the pool has stopped.
    void cancel();

    int received() const { return received_.load(); }

private:
    void arm();

    boost::asio::signal_set signals_;
    ShutdownBroadcaster& shutdown_;
    std::atomic<int> received_{0};
    std::atomic<bool> cancelled_{false};
};

} // namespace onionsite
