#pragma once

#include "dfm/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dfm::network {

/**
 * @brief Request context with parameters extracted from the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // :name captures, plus "wildcard" for *

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware runs before route lookup; returning false sends `response` as-is
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;              // Original pattern like "/files/*"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + pattern router for the store server
 *
 * Routes match against the decoded request path (query excluded). A path
 * that matches some route under a different method yields 405.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * router.get("/files/*", [](const HttpContext& ctx) {
 *     std::string relative = ctx.get_param("wildcard");
 *     ...
 * });
 * router.use([](const HttpContext& ctx, HttpResponse& res) {
 *     spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
 *     return true;  // Continue to handler
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void head(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers
     *
     * Middleware is executed in the order it's added. Register all
     * middleware before the server starts accepting requests.
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
};

/**
 * @brief Convert a URL pattern to a regex
 *
 * Converts:
 *   "/users/:id"  → "^/users/([^/]+)$"
 *   "/files/*"    → "^/files/(.*)$"   (captured as "wildcard")
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// JSON error body used by every non-2xx store response
HttpResponse json_error(HttpStatus status, const std::string& message);

} // namespace dfm::network
