#include "runtime/Orchestrator.hpp"
#include "runtime/Context.hpp"
#include "runtime/Errors.hpp"
#include "runtime/SignalForwarder.hpp"
#include "runtime/WorkerPool.hpp"

#include "http/Listener.hpp"
#include "site/Pages.hpp"

#include <exception>
#include <future>
#include <iostream>

using namespace onionsite;

Orchestrator::Orchestrator(Context& ctx,
                           ProcessLauncher& launcher,
                           std::shared_ptr<CommandRunner> runner)
    : ctx_(ctx),
      launcher_(launcher),
      runner_(std::move(runner)) {}

void Orchestrator::run() {
    const Config& cfg = ctx_.config;
    WorkerPool pool(worker_threads_);

    auto onion = std::make_shared<Listener>(
        pool.context(), "onion",
        tcp::endpoint(boost::asio::ip::address_v4::loopback(), cfg.onion_port),
        make_onion_router());
    auto pub = std::make_shared<Listener>(
        pool.context(), "public",
        tcp::endpoint(tcp::v4(), cfg.public_port),
        make_public_router(ctx_.onion_address));

    // ---- STARTUP: both sockets or nothing ----
    onion->bind();
    pub->bind();
    if (on_ready_) on_ready_(onion->local_endpoint(), pub->local_endpoint());

    // ---- DISCOVERY (fire-and-forget) ----
    AddressDiscoveryTask::spawn(std::make_shared<AddressDiscoveryTask>(
        runner_, cfg.query_command(), ctx_.onion_address, discovery_policy_));

    // ---- WORKERS + SIGNALS ----
    std::unique_ptr<SignalForwarder> signals;
    if (handle_signals_) {
        signals = std::make_unique<SignalForwarder>(pool.context(), ctx_.shutdown);
    }
    pool.start();
    std::cout << "[SITE] " << pool.size() << " worker threads\n";

    // ---- SUPERVISOR ----
    // A supervisor that throws must still release the listeners.
    ProcessSupervisor supervisor(launcher_, cfg.helper_command(), ctx_.shutdown, supervisor_policy_);
    auto supervised = std::async(std::launch::async, [this, &supervisor]() {
        try {
            return supervisor.run();
        } catch (const std::exception& e) {
            std::cerr << "[SUPERVISOR] Aborted: " << e.what() << "\n";
            ctx_.shutdown.fire();
            throw;
        }
    });

    // ---- SERVE ----
    auto serve = [this](std::shared_ptr<Listener> listener) {
        try {
            listener->serve(ctx_.shutdown.subscribe());
        } catch (const RuntimeError& e) {
            std::cerr << "[SITE] " << e.what() << ", shutting down\n";
            ctx_.shutdown.fire();
            throw;
        } catch (const std::exception& e) {
            ctx_.shutdown.fire();
            throw RuntimeError(listener->name() + " endpoint service error: " + e.what());
        }
    };
    auto onion_done  = std::async(std::launch::async, serve, onion);
    auto public_done = std::async(std::launch::async, serve, pub);

    std::exception_ptr listener_error;
    for (auto* done : {&onion_done, &public_done}) {
        try {
            done->get();
        } catch (const RuntimeError&) {
            if (!listener_error) listener_error = std::current_exception();
        }
    }

    SupervisorState outcome = SupervisorState::Failed;
    std::string supervisor_error;
    try {
        outcome = supervised.get();
    } catch (const std::exception& e) {
        supervisor_error = e.what();
    }

    pool.stop();
    if (signals) signals->cancel();

    if (listener_error) {
        std::cerr << "[SITE] Supervisor ended "
                  << (supervisor_error.empty() ? to_string(outcome) : "with error: " + supervisor_error)
                  << " after listener failure\n";
        std::rethrow_exception(listener_error);
    }
    if (!supervisor_error.empty()) {
        throw RuntimeError("helper supervision could not be joined: " + supervisor_error);
    }
    if (outcome == SupervisorState::Failed) {
        throw RuntimeError("helper process restart budget exhausted after " +
                           std::to_string(supervisor.attempts()) + " attempts");
    }
    std::cout << "[SITE] Clean shutdown\n";
}
