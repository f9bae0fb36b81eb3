#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "http/Router.hpp"
#include "runtime/ShutdownBroadcaster.hpp"

namespace onionsite {

class HttpSession;

// ---------------------------------------------------------------------------
// One listening socket serving one routing table on the shared worker pool.
//
// bind() happens up front so both listeners fail fast, before anything else
// starts. serve() runs the accept loop and blocks the caller until:
//   - the shutdown subscription fires: stop accepting, let every session
//     finish the request it is working on, close idle keep-alive
//     connections, return normally; or
//   - accept fails outside that path: same drain, then RuntimeError.
//
// Always held by shared_ptr; pending handlers keep it alive.
// ---------------------------------------------------------------------------
class Listener : public std::enable_shared_from_this<Listener> {
public:
    using tcp = boost::asio::ip::tcp;

    Listener(boost::asio::io_context& ioc,
             std::string name,
             tcp::endpoint endpoint,
             std::shared_ptr<const Router> router);

    // Open, SO_REUSEADDR, bind, listen. Throws StartupError.
    void bind();

    // Throws StartupError if the socket has no local address.
    tcp::endpoint local_endpoint() const;

    // Throws RuntimeError.
    void serve(ShutdownBroadcaster::Subscription shutdown);

    const std::string& name() const { return name_; }
    const Router& router() const { return *router_; }
    std::size_t connections_accepted() const { return accepted_.load(); }

    // Called by a session when it is destroyed.
    void session_closed();

private:
    void request_stop();
    void do_accept();
    void on_accept(boost::beast::error_code ec, tcp::socket socket);
    void finish_accepting(const std::string& error);

    boost::asio::io_context&      ioc_;
    std::string                   name_;
    tcp::endpoint                 endpoint_;
    std::shared_ptr<const Router> router_;
    tcp::acceptor                 acceptor_;   // strand-bound

    // Acceptor strand only.
    bool stopping_{false};
    bool finished_{false};

    mutable std::mutex                       mtx_;
    std::condition_variable                  cv_;
    bool                                     accept_done_{false};
    std::size_t                              active_{0};
    std::vector<std::weak_ptr<HttpSession>>  sessions_;
    std::string                              error_;
    std::atomic<std::size_t>                 accepted_{0};
};

} // namespace onionsite
