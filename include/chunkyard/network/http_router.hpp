#pragma once

#include "chunkyard/network/form_data.hpp"
#include "chunkyard/network/http_types.hpp"

#include <functional>
#include <regex>
#include <unordered_map>
#include <vector>

namespace chunkyard {
namespace network {

/**
 * @brief Request context handed to route handlers
 *
 * params holds ":name" segments of the matched pattern; query holds the
 * decoded query string.
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;
    FormFields query;

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before routing; return false to answer with `response` directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // e.g. "/upload/:identifier"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    /// Matches against the path only; the query string is ignored
    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path router with middleware
 *
 * @code
 * HttpRouter router;
 * router.get("/upload", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("chunk " + ctx.get_query("flowChunkNumber"));
 *     return res;
 * });
 * @endcode
 *
 * A path that exists under another method answers 405 instead of 404.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware; runs in registration order before any handler
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request; handler exceptions become 500 responses
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    /**
     * @brief "METHOD pattern" for every route, in registration order
     */
    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_exists(const std::string& path) const;
};

/**
 * @brief Convert a route pattern to an anchored regex
 *
 * "/users/:id" becomes "^/users/([^/]+)$" and appends "id" to param_names.
 * '*' matches the rest of the path.
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace chunkyard
