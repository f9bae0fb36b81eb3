#include "site/Pages.hpp"
#include "discovery/SharedAddressCell.hpp"

using namespace onionsite;

namespace {

Response healthz(const Request&) {
    return Response{http::status::ok, "text/plain; charset=utf-8", "ok\n"};
}

} // namespace

std::shared_ptr<const Router> onionsite::make_onion_router() {
    auto router = std::make_shared<Router>();
    router->get("/", [](const Request&) {
        return Response{http::status::ok, "text/html; charset=utf-8",
            "<h1>Hello!</h1><p>You are connected via the Tor network (onion service).</p>"};
    });
    router->get("/healthz", healthz);
    return router;
}

std::shared_ptr<const Router> onionsite::make_public_router(std::shared_ptr<const SharedAddressCell> address) {
    auto router = std::make_shared<Router>();

    router->get("/", [address](const Request&) {
        std::string body =
            "<h1>Hello!</h1><p>You are connected via the public endpoint. If you reached "
            "this through the Tor network, your connection is indirect; otherwise, "
            "you're connected directly.</p>";

        if (auto onion = address->get()) {
            body += "<p>This site is also available as an onion service: <a href=\"http://" +
                    *onion + "/\">" + *onion + "</a></p>";
        } else {
            body += "<p>The onion address is not yet known.</p>";
        }
        return Response{http::status::ok, "text/html; charset=utf-8", std::move(body)};
    });

    router->get("/onion-address", [address](const Request&) {
        if (auto onion = address->get()) {
            return Response{http::status::ok, "text/plain; charset=utf-8", *onion + "\n"};
        }
        return Response{http::status::service_unavailable, "text/plain; charset=utf-8",
                        "onion address not yet known\n"};
    });

    router->get("/healthz", healthz);
    return router;
}
