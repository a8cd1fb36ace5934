#include <catch2/catch_test_macros.hpp>
#include <set>
#include <sstream>

#include "ludo/router.hpp"

using namespace ludo;

namespace {
// Helper to split comma-separated methods
std::set<std::string> splitMethods(const std::string& allowHeader) {
    std::set<std::string> methods;
    std::istringstream iss(allowHeader);
    std::string method;
    while (std::getline(iss, method, ',')) {
        method.erase(0, method.find_first_not_of(" \t"));
        method.erase(method.find_last_not_of(" \t") + 1);
        methods.insert(method);
    }
    return methods;
}

Request makeRequest(const std::string& method, const std::string& path) {
    Request req;
    req.method_ = method;
    req.requestPath_ = path;
    req.httpVersionMajor_ = 1;
    req.httpVersionMinor_ = 1;
    return req;
}
}  // namespace

TEST_CASE("router functionality", "[router]") {
    Router router;
    bool handlerCalled = false;
    Router::Params capturedParams;
    std::vector<char> sendBuffer;
    Reply rep(sendBuffer);

    SECTION("should match route with parameter and extract param") {
        router.addRoute("POST",
                        "/products/{slug}/feedback",
                        [&](const Request&, Reply&, const Router::Params& params) {
                            handlerCalled = true;
                            capturedParams = params;
                        });

        Request req = makeRequest("POST", "/products/space-team/feedback");
        HandlerResult handled = router.handle(req, rep);

        REQUIRE(handled == HandlerResult::Matched);
        REQUIRE(handlerCalled);
        REQUIRE(capturedParams.size() == 1);
        REQUIRE(capturedParams["slug"] == "space-team");
    }
    SECTION("should not match when the number of segments differ") {
        router.addRoute("GET", "/products", [&](const Request&, Reply&, const Router::Params&) {
            handlerCalled = true;
        });

        Request req = makeRequest("GET", "/products/cah");
        HandlerResult handled = router.handle(req, rep);

        REQUIRE(handled == HandlerResult::NoMatch);
        REQUIRE_FALSE(handlerCalled);
        REQUIRE_FALSE(rep.isSent());
    }
    SECTION("should ignore the query string") {
        router.addRoute("GET", "/status", [&](const Request&, Reply&, const Router::Params&) {
            handlerCalled = true;
        });

        Request req = makeRequest("GET", "/status?verbose=1");
        REQUIRE(router.handle(req, rep) == HandlerResult::Matched);
        REQUIRE(handlerCalled);
    }
    SECTION("should not match extra slashes") {
        router.addRoute("GET", "/status", [&](const Request&, Reply&, const Router::Params&) {
            handlerCalled = true;
        });

        for (const char* path : {"/status/", "//status", "/status//"}) {
            Request req = makeRequest("GET", path);
            REQUIRE(router.handle(req, rep) == HandlerResult::NoMatch);
        }
        REQUIRE_FALSE(handlerCalled);
        REQUIRE_FALSE(rep.isSent());
    }
    SECTION("should not match an empty parameter") {
        router.addRoute("POST",
                        "/products/{slug}/feedback",
                        [&](const Request&, Reply&, const Router::Params&) {
                            handlerCalled = true;
                        });

        Request empty = makeRequest("POST", "/products//feedback");
        REQUIRE(router.handle(empty, rep) == HandlerResult::NoMatch);

        Request trailing = makeRequest("POST", "/products/cah/feedback/");
        REQUIRE(router.handle(trailing, rep) == HandlerResult::NoMatch);
        REQUIRE_FALSE(handlerCalled);
    }
    SECTION("should prefer literal segments over parameters") {
        std::string matched;
        router.addRoute("GET",
                        "/products/{slug}",
                        [&](const Request&, Reply&, const Router::Params&) { matched = "param"; });
        router.addRoute("GET",
                        "/products/featured",
                        [&](const Request&, Reply&, const Router::Params&) {
                            matched = "literal";
                        });

        Request req = makeRequest("GET", "/products/featured");
        REQUIRE(router.handle(req, rep) == HandlerResult::Matched);
        REQUIRE(matched == "literal");

        Request req2 = makeRequest("GET", "/products/dixit");
        REQUIRE(router.handle(req2, rep) == HandlerResult::Matched);
        REQUIRE(matched == "param");
    }
    SECTION("should register HEAD for GET routes") {
        router.addRoute("GET", "/products", [&](const Request&, Reply&, const Router::Params&) {
            handlerCalled = true;
        });

        Request req = makeRequest("HEAD", "/products");
        REQUIRE(router.handle(req, rep) == HandlerResult::Matched);
        REQUIRE(handlerCalled);
    }
    SECTION("should answer OPTIONS with Allow header for known path") {
        router.addRoute("GET", "/products", [](const Request&, Reply&, const Router::Params&) {});
        router.addRoute("POST", "/products", [](const Request&, Reply&, const Router::Params&) {});

        Request req = makeRequest("OPTIONS", "/products");
        REQUIRE(router.handle(req, rep) == HandlerResult::Matched);
        REQUIRE(rep.isSent());
        REQUIRE(rep.getStatus() == Reply::ok);
        auto methods = splitMethods(rep.getHeaderValue("Allow"));
        REQUIRE(methods == std::set<std::string>{"GET", "HEAD", "POST", "OPTIONS"});
    }
    SECTION("should not answer OPTIONS for unknown path") {
        router.addRoute("GET", "/products", [](const Request&, Reply&, const Router::Params&) {});

        Request req = makeRequest("OPTIONS", "/unknown");
        REQUIRE(router.handle(req, rep) == HandlerResult::NoMatch);
        REQUIRE_FALSE(rep.isSent());
    }
    SECTION("should send 405 with Allow for HTTP/1.1 and known path with other method") {
        router.addRoute("POST",
                        "/products/{slug}/feedback",
                        [](const Request&, Reply&, const Router::Params&) {});

        Request req = makeRequest("GET", "/products/cah/feedback");
        REQUIRE(router.handle(req, rep) == HandlerResult::NoMatch);
        REQUIRE(rep.isSent());
        REQUIRE(rep.getStatus() == Reply::method_not_allowed);
        REQUIRE(rep.getHeaderValue("Allow") == "POST");
    }
    SECTION("should not send 405 for HTTP/1.0") {
        router.addRoute("POST",
                        "/products/{slug}/feedback",
                        [](const Request&, Reply&, const Router::Params&) {});

        Request req = makeRequest("GET", "/products/cah/feedback");
        req.httpVersionMinor_ = 0;
        REQUIRE(router.handle(req, rep) == HandlerResult::NoMatch);
        REQUIRE_FALSE(rep.isSent());
    }
}
