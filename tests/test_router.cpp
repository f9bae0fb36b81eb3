#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "discovery/SharedAddressCell.hpp"
#include "http/Router.hpp"
#include "site/Pages.hpp"
#include "Fakes.hpp"

using namespace onionsite;
using onionsite::test::sample_onion;

namespace {

Request make_request(http::verb method, const std::string& target) {
    Request req{method, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

std::string header(const Reply& res, http::field f) {
    return std::string(res[f]);
}

} // namespace

TEST(Router, DispatchesGet) {
    Router r;
    r.get("/", [](const Request&) { return Response{http::status::ok, "text/plain", "root"}; });

    Reply res = r.handle(make_request(http::verb::get, "/"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "root");
    EXPECT_EQ(header(res, http::field::content_type), "text/plain");
    EXPECT_EQ(header(res, http::field::server), "onionsite");
    EXPECT_EQ(header(res, http::field::content_length), "4");
}

TEST(Router, IgnoresQueryString) {
    Router r;
    r.get("/a", [](const Request&) { return Response{http::status::ok, "text/plain", "a"}; });
    EXPECT_EQ(r.handle(make_request(http::verb::get, "/a?x=1")).body(), "a");
}

TEST(Router, UnknownPathIs404) {
    Router r;
    r.get("/", [](const Request&) { return Response{}; });
    EXPECT_EQ(r.handle(make_request(http::verb::get, "/missing")).result(), http::status::not_found);
}

TEST(Router, WrongMethodIs405WithAllow) {
    Router r;
    r.get("/", [](const Request&) { return Response{}; });
    Reply res = r.handle(make_request(http::verb::post, "/"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(header(res, http::field::allow), "GET");
}

TEST(Router, HeadUsesGetWithoutBody) {
    Router r;
    r.get("/", [](const Request&) { return Response{http::status::ok, "text/plain", "hello"}; });
    Reply res = r.handle(make_request(http::verb::head, "/"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(res.body().empty());
    EXPECT_EQ(header(res, http::field::content_length), "5");
}

TEST(Router, ThrowingHandlerIs500) {
    Router r;
    r.get("/boom", [](const Request&) -> Response { throw std::runtime_error("boom"); });
    EXPECT_EQ(r.handle(make_request(http::verb::get, "/boom")).result(),
              http::status::internal_server_error);
}

TEST(Router, KeepAliveFollowsRequest) {
    Router r;
    r.get("/", [](const Request&) { return Response{}; });
    Request req = make_request(http::verb::get, "/");
    req.keep_alive(false);
    EXPECT_FALSE(r.handle(req).keep_alive());
}

TEST(Pages, OnionRoot) {
    auto router = make_onion_router();
    Reply res = router->handle(make_request(http::verb::get, "/"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("onion service"), std::string::npos);
    EXPECT_EQ(router->handle(make_request(http::verb::get, "/healthz")).body(), "ok\n");
}

TEST(Pages, PublicBeforeDiscovery) {
    auto cell = std::make_shared<SharedAddressCell>();
    auto router = make_public_router(cell);

    Reply root = router->handle(make_request(http::verb::get, "/"));
    EXPECT_EQ(root.result(), http::status::ok);
    EXPECT_NE(root.body().find("public endpoint"), std::string::npos);
    EXPECT_NE(root.body().find("not yet known"), std::string::npos);

    Reply addr = router->handle(make_request(http::verb::get, "/onion-address"));
    EXPECT_EQ(addr.result(), http::status::service_unavailable);
}

TEST(Pages, PublicAfterDiscovery) {
    auto cell = std::make_shared<SharedAddressCell>();
    auto router = make_public_router(cell);
    cell->set(sample_onion());

    Reply root = router->handle(make_request(http::verb::get, "/"));
    EXPECT_NE(root.body().find("http://" + sample_onion() + "/"), std::string::npos);

    Reply addr = router->handle(make_request(http::verb::get, "/onion-address"));
    EXPECT_EQ(addr.result(), http::status::ok);
    EXPECT_EQ(addr.body(), sample_onion() + "\n");
}
