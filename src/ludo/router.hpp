#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ludo/reply.hpp"
#include "ludo/request.hpp"

namespace ludo {

enum class HandlerResult { Matched, NoMatch };

// Maps method and path pattern to a handler. Patterns are made of literal
// segments and named parameters, e.g. "/products/{slug}/feedback".
class Router {
   public:
    using Params = std::unordered_map<std::string, std::string>;
    using Handler = std::function<void(const Request&, Reply&, const Params&)>;

    // Add a route. GET routes are also registered for HEAD.
    void addRoute(const std::string& method, const std::string& pathPattern, Handler handler);

    // Dispatch to the matching route. A reply may be sent even on NoMatch
    // (405 Method Not Allowed), check Reply::isSent().
    HandlerResult handle(const Request& req, Reply& rep) const;

   private:
    struct Segment {
        std::string text_;
        bool isParameter_;
    };

    struct RouteEntry {
        std::vector<Segment> segments_;
        size_t paramCount_;
        Handler handler_;
    };

    static RouteEntry parsePathPattern(const std::string& pathPattern, Handler handler);

    // Split a path into its non-empty segments, query string excluded.
    static std::vector<std::string> splitPath(const std::string& path);

    static bool matchPath(const RouteEntry& routeEntry,
                          const std::vector<std::string>& requestSegments,
                          Params& params);

    void insertRoute(const std::string& method, RouteEntry entry);

    // Methods with at least one route matching the path.
    std::vector<std::string> findAllowedMethods(
        const std::vector<std::string>& requestSegments) const;

    static std::string joinMethods(const std::vector<std::string>& methods);

    std::unordered_map<std::string, std::vector<RouteEntry>> routes_;

    // Registration order of methods, keeps Allow headers stable.
    std::vector<std::string> methods_;
};

}  // namespace ludo
