#include "runtime/SignalForwarder.hpp"
#include "runtime/ShutdownBroadcaster.hpp"

#include <boost/system/error_code.hpp>

#include <csignal>
#include <iostream>

using namespace onionsite;

SignalForwarder::SignalForwarder(boost::asio::io_context& ioc, ShutdownBroadcaster& shutdown)
    : signals_(ioc, SIGINT, SIGTERM),
      shutdown_(shutdown) {
    arm();
}

SignalForwarder::~SignalForwarder() {
    cancel();
}

void SignalForwarder::cancel() {
    if (cancelled_.exchange(true)) return;
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);
}

void SignalForwarder::arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;  // cancelled

        received_.fetch_add(1);
        if (shutdown_.fire()) {
            std::cout << "[SIGNAL] Received " << signo << ", shutting down\n";
        } else {
            std::cout << "[SIGNAL] Received " << signo << ", shutdown already in progress\n";
        }

        if (!cancelled_.load()) arm();
    });
}
