#include "dfm/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace dfm::network;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& path) {
    HttpRequest request;
    request.method = method;
    request.url = path;
    request.path = path;
    return request;
}

HttpResponse text(const std::string& body) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(body);
    return response;
}

} // namespace

TEST(HttpRouterTest, WildcardCapture) {
    HttpRouter router;
    router.get("/files/*", [](const HttpContext& ctx) { return text(ctx.get_param("wildcard")); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/files/dir/a b.bin"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "dir/a b.bin");
}

TEST(HttpRouterTest, NamedParameters) {
    HttpRouter router;
    router.get("/items/:id/parts/:part", [](const HttpContext& ctx) {
        return text(ctx.get_param("id") + ":" + ctx.get_param("part"));
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/items/42/parts/7"));
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "42:7");
}

TEST(HttpRouterTest, NotFoundAndMethodNotAllowed) {
    HttpRouter router;
    router.get("/api/item", [](const HttpContext&) { return text("ok"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/nope")).status_code, 404);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::PUT, "/api/item")).status_code, 405);
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    int handled = 0;
    router.get("/files/*", [&](const HttpContext&) {
        ++handled;
        return text("ok");
    });
    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.path == "/files/blocked") {
            response = json_error(HttpStatus::SERVICE_UNAVAILABLE, "injected");
            return false;
        }
        return true;
    });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/files/blocked")).status_code, 503);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/files/open")).status_code, 200);
    EXPECT_EQ(handled, 1);
}

TEST(HttpRouterTest, HandlerExceptionBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse { throw std::runtime_error("boom"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);
    EXPECT_EQ(response.get_header("Content-Type"), "application/json");
}

TEST(HttpRouterTest, ListRoutes) {
    HttpRouter router;
    router.get("/api/item", [](const HttpContext&) { return text("a"); });
    router.head("/files/*", [](const HttpContext&) { return text("b"); });

    const auto routes = router.list_routes();
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0], "GET /api/item");
    EXPECT_EQ(routes[1], "HEAD /files/*");
}
