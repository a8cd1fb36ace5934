#include <algorithm>
#include <sstream>

#include "ludo/router.hpp"

namespace ludo {

void Router::addRoute(const std::string& method, const std::string& pathPattern, Handler handler) {
    insertRoute(method, parsePathPattern(pathPattern, handler));
    if (method == "GET") {
        insertRoute("HEAD", parsePathPattern(pathPattern, handler));
    }
}

void Router::insertRoute(const std::string& method, RouteEntry entry) {
    if (std::find(methods_.begin(), methods_.end(), method) == methods_.end()) {
        methods_.push_back(method);
    }
    auto& vec = routes_[method];
    vec.push_back(std::move(entry));
    // More literal segments (fewer parameters) first
    std::stable_sort(vec.begin(), vec.end(), [](const RouteEntry& a, const RouteEntry& b) {
        return a.paramCount_ < b.paramCount_;
    });
}

HandlerResult Router::handle(const Request& req, Reply& rep) const {
    std::vector<std::string> requestSegments = splitPath(req.requestPath_);

    if (req.method_ == "OPTIONS") {
        std::vector<std::string> allowedMethods = findAllowedMethods(requestSegments);
        if (allowedMethods.empty()) {
            return HandlerResult::NoMatch;
        }
        allowedMethods.push_back("OPTIONS");
        rep.addHeader("Allow", joinMethods(allowedMethods));
        rep.send(Reply::ok);
        return HandlerResult::Matched;
    }

    auto methodIt = routes_.find(req.method_);
    if (methodIt != routes_.end()) {
        for (const auto& routeEntry : methodIt->second) {
            Params params;
            if (matchPath(routeEntry, requestSegments, params)) {
                routeEntry.handler_(req, rep, params);
                return HandlerResult::Matched;
            }
        }
    }

    // Path known under other methods only
    if (req.httpVersionMajor_ == 1 && req.httpVersionMinor_ == 1) {
        std::vector<std::string> allowedMethods = findAllowedMethods(requestSegments);
        if (!allowedMethods.empty()) {
            rep.addHeader("Allow", joinMethods(allowedMethods));
            rep.addHeader("Connection", "close");
            rep.send(Reply::method_not_allowed);
        }
    }

    return HandlerResult::NoMatch;
}

std::vector<std::string> Router::findAllowedMethods(
    const std::vector<std::string>& requestSegments) const {
    std::vector<std::string> allowedMethods;

    for (const auto& method : methods_) {
        const std::vector<RouteEntry>& entries = routes_.at(method);
        for (const auto& routeEntry : entries) {
            Params params;
            if (matchPath(routeEntry, requestSegments, params)) {
                allowedMethods.push_back(method);
                break;
            }
        }
    }

    return allowedMethods;
}

std::string Router::joinMethods(const std::vector<std::string>& methods) {
    std::ostringstream oss;
    for (size_t i = 0; i < methods.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << methods[i];
    }
    return oss.str();
}

Router::RouteEntry Router::parsePathPattern(const std::string& pathPattern, Handler handler) {
    RouteEntry entry;
    entry.handler_ = handler;
    entry.paramCount_ = 0;

    for (const std::string& segment : splitPath(pathPattern)) {
        if (segment.size() >= 2 && segment.front() == '{' && segment.back() == '}') {
            entry.segments_.push_back({segment.substr(1, segment.size() - 2), true});
            entry.paramCount_++;
        } else {
            entry.segments_.push_back({segment, false});
        }
    }

    return entry;
}

// Segments between slashes after the leading one. Empty segments are kept so
// "/status/" and "//status" do not match "/status".
std::vector<std::string> Router::splitPath(const std::string& path) {
    std::vector<std::string> segments;

    const std::string cleanPath = path.substr(0, path.find('?'));
    size_t start = (!cleanPath.empty() && cleanPath[0] == '/') ? 1 : 0;
    while (true) {
        size_t slash = cleanPath.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(cleanPath.substr(start));
            break;
        }
        segments.push_back(cleanPath.substr(start, slash - start));
        start = slash + 1;
    }

    return segments;
}

bool Router::matchPath(const RouteEntry& routeEntry,
                       const std::vector<std::string>& requestSegments,
                       Params& params) {
    if (requestSegments.size() != routeEntry.segments_.size()) {
        return false;
    }

    for (size_t i = 0; i < routeEntry.segments_.size(); ++i) {
        const Segment& segment = routeEntry.segments_[i];
        if (segment.isParameter_) {
            if (requestSegments[i].empty()) {
                return false;
            }
            params[segment.text_] = requestSegments[i];
        } else if (segment.text_ != requestSegments[i]) {
            return false;
        }
    }

    return true;
}

}  // namespace ludo
