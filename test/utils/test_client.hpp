#pragma once

#include <asio.hpp>
#include <istream>
#include <string>
#include <vector>

#include "ludo/parse_common.hpp"

// Blocking HTTP client for end to end tests. Runs on its own io_context so it
// never competes with the server's.
class TestClient {
   public:
    TestClient() : socket_(ioc_) {}
    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    struct TestResult {
        enum Action { None, Failed, ReadContent, Closed } action_ = None;
        std::vector<std::string> headers_;
        std::string content_;
        int statusCode_ = 0;
        std::string httpVersion_;

        std::string getHeaderValue(const std::string& name) const {
            for (const auto& h : headers_) {
                auto pos = h.find(':');
                if (pos != std::string::npos && ludo::iequals(h.substr(0, pos), name)) {
                    auto value = h.substr(pos + 1);
                    value.erase(0, value.find_first_not_of(" \t"));
                    return value;
                }
            }
            return "";
        }
    };

    bool connect(const std::string& host, uint16_t port) {
        asio::ip::tcp::resolver resolver(ioc_);
        std::error_code ec;
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return false;
        }
        asio::connect(socket_, endpoints, ec);
        return !ec;
    }

    // Write raw bytes, the request may be split over several calls.
    bool send(const std::string& data) {
        std::error_code ec;
        asio::write(socket_, asio::buffer(data), ec);
        return !ec;
    }

    // Read one response. isHead: the body announced by Content-Length is not sent.
    TestResult readResponse(bool isHead = false) {
        TestResult result;
        std::error_code ec;

        asio::read_until(socket_, response_, "\r\n\r\n", ec);
        if (ec) {
            result.action_ = (ec == asio::error::eof) ? TestResult::Closed : TestResult::Failed;
            return result;
        }

        std::istream responseStream(&response_);
        responseStream >> result.httpVersion_ >> result.statusCode_;
        std::string line;
        std::getline(responseStream, line);
        while (std::getline(responseStream, line) && line != "\r") {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            result.headers_.push_back(line);
        }

        size_t contentLength = 0;
        std::string lenStr = result.getHeaderValue("Content-Length");
        if (!lenStr.empty()) {
            contentLength = std::stoul(lenStr);
        }
        if (isHead) {
            contentLength = 0;
        }

        if (response_.size() < contentLength) {
            asio::read(socket_,
                       response_,
                       asio::transfer_exactly(contentLength - response_.size()),
                       ec);
            if (ec) {
                result.action_ = TestResult::Failed;
                return result;
            }
        }

        result.content_.resize(contentLength);
        responseStream.read(&result.content_[0], contentLength);
        result.action_ = TestResult::ReadContent;
        return result;
    }

    TestResult request(const std::string& data, bool isHead = false) {
        if (!send(data)) {
            TestResult failed;
            failed.action_ = TestResult::Failed;
            return failed;
        }
        return readResponse(isHead);
    }

    // Close without reading what the server sent.
    void close() {
        std::error_code ignored;
        socket_.close(ignored);
    }

    // True when the server has closed the connection.
    bool isClosedByServer() {
        std::error_code ec;
        char c;
        socket_.read_some(asio::buffer(&c, 1), ec);
        return ec == asio::error::eof || ec == asio::error::connection_reset;
    }

   private:
    asio::io_context ioc_;
    asio::ip::tcp::socket socket_;
    asio::streambuf response_;
};
