#pragma once
#include <boost/beast/http.hpp>

#include <functional>
#include <map>
#include <string>

namespace onionsite {

namespace http = boost::beast::http;

using Request  = http::request<http::string_body>;
using Reply    = http::response<http::string_body>;

struct Response {
    http::status status       = http::status::ok;
    std::string  content_type = "text/html; charset=utf-8";
    std::string  body;
};

using Handler = std::function<Response(const Request&)>;

// Routing table handed to a Listener. Built once before serving and only
// read afterwards, so handle() is safe from any number of sessions.
class Router {
public:
    Router& route(http::verb method, const std::string& path, Handler handler);
    Router& get(const std::string& path, Handler handler) {
        return route(http::verb::get, path, std::move(handler));
    }

    // 404 for unknown paths, 405 (with Allow) for a known path and an
    // unregistered method. HEAD falls back to the GET handler without a body.
    Reply handle(const Request& req) const;

private:
    std::map<std::string, std::map<http::verb, Handler>> routes_;
};

} // namespace onionsite
