#include "http/Router.hpp"

#include <exception>
#include <iostream>

using namespace onionsite;

namespace {

Reply make_reply(const Request& req, const Response& r) {
    Reply res{r.status, req.version()};
    res.set(http::field::server, "onionsite");
    res.set(http::field::content_type, r.content_type);
    res.keep_alive(req.keep_alive());
    res.body() = r.body;
    res.prepare_payload();
    return res;
}

Response text(http::status status, std::string body) {
    return Response{status, "text/plain; charset=utf-8", std::move(body)};
}

} // namespace

Router& Router::route(http::verb method, const std::string& path, Handler handler) {
    routes_[path][method] = std::move(handler);
    return *this;
}

Reply Router::handle(const Request& req) const {
    std::string path(req.target());
    auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);

    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return make_reply(req, text(http::status::not_found, "not found\n"));
    }

    const auto& methods = it->second;
    const bool head = req.method() == http::verb::head;
    auto h = methods.find(head ? http::verb::get : req.method());
    if (head && h == methods.end()) h = methods.find(http::verb::head);

    if (h == methods.end()) {
        std::string allow;
        for (const auto& m : methods) {
            if (!allow.empty()) allow += ", ";
            allow += std::string(http::to_string(m.first));
        }
        Reply res = make_reply(req, text(http::status::method_not_allowed, "method not allowed\n"));
        res.set(http::field::allow, allow);
        return res;
    }

    Response r;
    try {
        r = h->second(req);
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] Handler for " << path << " threw: " << e.what() << "\n";
        r = text(http::status::internal_server_error, "internal server error\n");
    }

    Reply res = make_reply(req, r);
    if (head) {
        // Keep the GET Content-Length, send no body.
        auto length = res.body().size();
        res.body().clear();
        res.content_length(length);
    }
    return res;
}
