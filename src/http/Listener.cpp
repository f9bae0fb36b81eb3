#include "http/Listener.hpp"
#include "runtime/Errors.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

namespace asio  = boost::asio;
namespace beast = boost::beast;

namespace onionsite {

namespace {

std::string describe(const boost::asio::ip::tcp::endpoint& ep) {
    std::ostringstream o;
    o << ep;
    return o.str();
}

constexpr std::chrono::seconds READ_TIMEOUT{30};

} // namespace

// One connection. Reads requests, answers them through the listener's
// router, honours keep-alive. All handlers run on the connection's strand.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(Listener::tcp::socket&& socket, std::shared_ptr<Listener> owner)
        : stream_(std::move(socket)), owner_(std::move(owner)) {}

    ~HttpSession() {
        owner_->session_closed();
    }

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

    // Finish the request in flight, if any, then close.
    void stop() {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
            self->stopping_ = true;
            if (!self->busy_) self->do_close();
        });
    }

private:
    void do_read() {
        if (stopping_) return do_close();

        req_ = {};
        stream_.expires_after(READ_TIMEOUT);
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) return;  // timeout, reset or cancelled by stop()

        busy_ = true;
        auto res = std::make_shared<Reply>(owner_->router().handle(req_));
        res_ = res;
        http::async_write(stream_, *res,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                    res->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        busy_ = false;
        res_.reset();
        if (ec) return;
        if (close || stopping_) return do_close();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(Listener::tcp::socket::shutdown_both, ec);
        stream_.close();
    }

    beast::tcp_stream         stream_;
    beast::flat_buffer        buffer_;
    Request                   req_;
    std::shared_ptr<Reply>    res_;
    std::shared_ptr<Listener> owner_;
    bool                      busy_{false};
    bool                      stopping_{false};
};

Listener::Listener(asio::io_context& ioc,
                   std::string name,
                   tcp::endpoint endpoint,
                   std::shared_ptr<const Router> router)
    : ioc_(ioc),
      name_(std::move(name)),
      endpoint_(std::move(endpoint)),
      router_(std::move(router)),
      acceptor_(asio::make_strand(ioc)) {}

void Listener::bind() {
    beast::error_code ec;
    const std::string where = name_ + " listener on " + describe(endpoint_);

    acceptor_.open(endpoint_.protocol(), ec);
    if (ec) throw StartupError("Unable to open " + where + ": " + ec.message());

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) throw StartupError("Unable to set SO_REUSEADDR on " + where + ": " + ec.message());

    acceptor_.bind(endpoint_, ec);
    if (ec) {
        acceptor_.close(ec);
        throw StartupError("Unable to bind " + where + ": " + ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close(ec);
        throw StartupError("Unable to listen on " + where + ": " + ec.message());
    }

    std::cout << "[HTTP] " << name_ << " endpoint listening on "
              << describe(local_endpoint()) << "\n";
}

Listener::tcp::endpoint Listener::local_endpoint() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    if (ec) throw StartupError("Unable to get local address of " + name_ + " listener: " + ec.message());
    return ep;
}

void Listener::serve(ShutdownBroadcaster::Subscription shutdown) {
    if (!acceptor_.is_open()) {
        throw RuntimeError(name_ + " endpoint service error: serve() before bind()");
    }

    std::weak_ptr<Listener> weak = shared_from_this();
    shutdown.on_fire([weak]() {
        if (auto self = weak.lock()) self->request_stop();
    });

    asio::post(acceptor_.get_executor(),
               beast::bind_front_handler(&Listener::do_accept, shared_from_this()));

    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return accept_done_ && active_ == 0; });

    if (!error_.empty()) {
        throw RuntimeError(name_ + " endpoint service error: " + error_);
    }
    std::cout << "[HTTP] " << name_ << " endpoint stopped after "
              << accepted_.load() << " connections\n";
}

void Listener::session_closed() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        --active_;
    }
    cv_.notify_all();
}

void Listener::request_stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        if (self->stopping_) return;
        self->stopping_ = true;
        // Cancels the pending accept; on_accept then finishes the loop.
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void Listener::do_accept() {
    if (stopping_) return finish_accepting("");

    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (stopping_) {
        beast::error_code ignored;
        socket.close(ignored);
        return finish_accepting("");
    }

    if (ec == asio::error::connection_aborted) return do_accept();  // peer gave up
    if (ec) return finish_accepting("accept failed: " + ec.message());

    accepted_.fetch_add(1);
    auto session = std::make_shared<HttpSession>(std::move(socket), shared_from_this());
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++active_;
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<HttpSession>& w) { return w.expired(); }),
                        sessions_.end());
        sessions_.push_back(session);
    }
    session->run();

    do_accept();
}

void Listener::finish_accepting(const std::string& error) {
    if (finished_) return;
    finished_ = true;
    stopping_ = true;

    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<HttpSession>> live;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& w : sessions_) {
            if (auto s = w.lock()) live.push_back(std::move(s));
        }
        sessions_.clear();
        error_ = error;
        accept_done_ = true;
    }
    for (auto& s : live) s->stop();
    live.clear();
    cv_.notify_all();

    if (!error.empty()) {
        std::cerr << "[HTTP] " << name_ << " endpoint " << error << "\n";
    }
}

} // namespace onionsite
