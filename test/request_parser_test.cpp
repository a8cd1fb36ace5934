#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "ludo/request.hpp"
#include "ludo/request_parser.hpp"

using namespace ludo;

namespace {

std::vector<char> convertToCharVec(const std::string &s) {
    std::vector<char> ret(s.begin(), s.end());
    return ret;
}

struct RequestFixture {
    explicit RequestFixture(size_t maxBodySize = 1024) : parser(maxBodySize) {}

    // method to use when the entire request is available
    RequestParser::result_type parseComplete(const std::string &text) {
        return parser.parse(request, convertToCharVec(text));
    }

    RequestParser parser;
    Request request;
};

}  // namespace

TEST_CASE("parse GET request", "[request_parser]") {
    RequestFixture fixture;

    SECTION("should return bad for misspelling") {
        auto result = fixture.parseComplete("GET /uri HTTTP/0.9\r\n\r\n");

        REQUIRE(result == RequestParser::bad);
    }
    SECTION("should parse GET HTTP/1.0") {
        auto result = fixture.parseComplete("GET /uri HTTP/1.0\r\nHost: www.example.com\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.method_ == "GET");
        REQUIRE(fixture.request.uri_ == "/uri");
        REQUIRE(fixture.request.httpVersionMajor_ == 1);
        REQUIRE(fixture.request.httpVersionMinor_ == 0);
        REQUIRE(fixture.request.keepAlive_ == false);
    }
    SECTION("should parse GET HTTP/1.0 with Connection: Keep-Alive") {
        auto result = fixture.parseComplete(
            "GET /uri HTTP/1.0\r\nHost: www.example.com\r\nConnection: Keep-Alive\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.keepAlive_ == true);
    }
    SECTION("should parse GET HTTP/1.1 with keep-alive as default") {
        auto result = fixture.parseComplete("GET /status HTTP/1.1\r\nHost: localhost\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.keepAlive_ == true);
        REQUIRE(fixture.request.getHeaderValue("host") == "localhost");
    }
    SECTION("should handle Connection: close for HTTP/1.1") {
        auto result = fixture.parseComplete(
            "GET /status HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.keepAlive_ == false);
    }
    SECTION("should return version_not_supported for HTTP/2.0") {
        auto result = fixture.parseComplete("GET /status HTTP/2.0\r\n\r\n");

        REQUIRE(result == RequestParser::version_not_supported);
    }
    SECTION("should return bad for GET with body") {
        auto result = fixture.parseComplete(
            "GET /status HTTP/1.1\r\nContent-Length: 2\r\n\r\nab");

        REQUIRE(result == RequestParser::bad);
    }
    SECTION("should accept GET with Content-Length 0") {
        auto result =
            fixture.parseComplete("GET /status HTTP/1.1\r\nContent-Length: 0\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.body_.empty());
    }
}

TEST_CASE("parse request in several parts", "[request_parser]") {
    RequestFixture fixture;
    const std::string request =
        "POST /products/cah/feedback HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 12\r\n"
        "\r\n"
        "{\"rating\":5}";

    SECTION("should be indeterminate until the last byte") {
        for (size_t split = 1; split < request.size(); split += 7) {
            fixture.request = Request();
            fixture.parser.reset();

            auto first = fixture.parser.parse(
                fixture.request, convertToCharVec(request.substr(0, split)));
            REQUIRE(first == RequestParser::indeterminate);

            auto second =
                fixture.parser.parse(fixture.request, convertToCharVec(request.substr(split)));
            REQUIRE(second == RequestParser::good_complete);
            REQUIRE(std::string(fixture.request.body_.begin(), fixture.request.body_.end()) ==
                    "{\"rating\":5}");
        }
    }
}

TEST_CASE("parse POST request", "[request_parser]") {
    RequestFixture fixture(16);

    SECTION("should collect the body") {
        auto result = fixture.parseComplete(
            "POST /products/cah/feedback HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.hasContentLength());
        REQUIRE(fixture.request.getContentLength() == 5);
        REQUIRE(std::string(fixture.request.body_.begin(), fixture.request.body_.end()) ==
                "hello");
    }
    SECTION("should treat HTTP/1.1 POST without Content-Length as empty") {
        auto result = fixture.parseComplete(
            "POST /products/cah/feedback HTTP/1.1\r\nHost: x\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.method_ == "POST");
        REQUIRE_FALSE(fixture.request.hasContentLength());
        REQUIRE(fixture.request.body_.empty());
    }
    SECTION("should accept HTTP/1.0 POST without Content-Length") {
        auto result = fixture.parseComplete("POST /products/cah/feedback HTTP/1.0\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.body_.empty());
    }
    SECTION("should read past a body larger than max size without keeping it") {
        std::string body(40, 'x');
        auto result = fixture.parseComplete(
            "POST /products/cah/feedback HTTP/1.1\r\nContent-Length: 40\r\n\r\n" + body);

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.getContentLength() == 40);
        REQUIRE(fixture.request.body_.empty());
    }
    SECTION("should wait for all bytes of a large body") {
        auto result = fixture.parseComplete(
            "POST /products/cah/feedback HTTP/1.1\r\nContent-Length: 20000\r\n\r\n" +
            std::string(100, 'x'));

        REQUIRE(result == RequestParser::indeterminate);
    }
    SECTION("should return bad for chunked body with Content-Length") {
        auto result = fixture.parseComplete(
            "POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\nContent-Length: 3\r\n\r\n");

        REQUIRE(result == RequestParser::bad);
    }
    SECTION("should return bad for unsupported Transfer-Encoding") {
        auto result =
            fixture.parseComplete("POST /x HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");

        REQUIRE(result == RequestParser::bad);
    }
    SECTION("should return bad for invalid Content-Length") {
        REQUIRE(fixture.parseComplete("POST /x HTTP/1.1\r\nContent-Length: 1x\r\n\r\n") ==
                RequestParser::bad);
    }
    SECTION("should return bad for negative Content-Length") {
        REQUIRE(fixture.parseComplete("POST /x HTTP/1.1\r\nContent-Length: -1\r\n\r\n") ==
                RequestParser::bad);
    }
    SECTION("should return bad for conflicting Content-Length headers") {
        auto result = fixture.parseComplete(
            "POST /x HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\nab");

        REQUIRE(result == RequestParser::bad);
    }
}

TEST_CASE("parse chunked request body", "[request_parser]") {
    RequestFixture fixture(16);
    const std::string head =
        "POST /products/cah/feedback HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n";

    SECTION("should join the chunks") {
        auto result = fixture.parseComplete(head + "5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.isChunked());
        REQUIRE(std::string(fixture.request.body_.begin(), fixture.request.body_.end()) ==
                "hello world");
    }
    SECTION("should skip trailer fields") {
        auto result = fixture.parseComplete(head + "2\r\nab\r\n0\r\nX-Trailer: 1\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.body_.size() == 2);
    }
    SECTION("should drop a chunked body larger than max size") {
        auto result = fixture.parseComplete(head + "14\r\n" + std::string(20, 'y') +
                                            "\r\n0\r\n\r\n");

        REQUIRE(result == RequestParser::good_complete);
        REQUIRE(fixture.request.body_.empty());
    }
    SECTION("should return bad for a malformed chunk size") {
        REQUIRE(fixture.parseComplete(head + "zz\r\n") == RequestParser::bad);
    }
    SECTION("should return bad when chunk data overruns its size") {
        REQUIRE(fixture.parseComplete(head + "2\r\nabc\r\n") == RequestParser::bad);
    }
}

TEST_CASE("reset parser", "[request_parser]") {
    RequestFixture fixture;

    SECTION("should parse a second request after reset") {
        REQUIRE(fixture.parseComplete("GET /a HTTP/1.1\r\n\r\n") == RequestParser::good_complete);

        fixture.parser.reset();
        fixture.request = Request();

        REQUIRE(fixture.parseComplete("GET /b HTTP/1.1\r\n\r\n") == RequestParser::good_complete);
        REQUIRE(fixture.request.uri_ == "/b");
    }
}
