/**
 * @file http_router.hpp
 * @brief Method + path routing with middleware for the upload API
 *
 * WHAT IT DOES:
 * - Matches "/api/uploads/:uploadId" style patterns and captures parameters
 * - Runs middleware (authentication) before the handler
 * - Answers 404 / 405 for unknown paths and methods
 */

#pragma once

#include "chunkup/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::network {

/**
 * @brief Per-request context handed to middleware and handlers
 *
 * params holds path parameters (":id"), attributes holds values placed by
 * middleware for the handler (e.g. the authenticated owner id).
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;
    std::unordered_map<std::string, std::string> attributes;

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    std::string get_attribute(const std::string& name) const {
        auto it = attributes.find(name);
        return (it != attributes.end()) ? it->second : "";
    }

    void set_attribute(const std::string& name, std::string value) {
        attributes[name] = std::move(value);
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before route dispatch; return false to send @p response as is
 */
using Middleware = std::function<bool(HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // "/api/uploads/:uploadId"
    std::vector<std::string> param_names;  // Filled before regex is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path router with middleware
 *
 * Routes match on the request path only; the query string is available
 * through HttpRequest::query.
 *
 * @code
 * HttpRouter router;
 * router.use(auth_middleware);
 * router.get("/api/uploads/status", handle_status);
 * router.delete_("/api/uploads/:uploadId", handle_cancel);
 * HttpResponse res = router.handle_request(req);
 * @endcode
 *
 * Routes must be registered before the server starts; handle_request() is
 * then safe to call from several io_context threads.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /// Middleware runs in registration order before dispatch
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request
     *
     * No route for the path gives the not-found handler's response; a path
     * that exists under another method gives 405. A throwing handler gives 500.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    std::size_t route_count() const { return routes_.size(); }

private:
    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;
};

/**
 * @brief Convert a route pattern to an anchored regex
 *
 *   "/users/:id"          -> "^/users/([^/]+)$"
 *   "/posts/:id/comments" -> "^/posts/([^/]+)/comments$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace chunkup::network
