#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "ludo/header.hpp"
#include "ludo/parse_common.hpp"

namespace ludo {

// One request as read off a connection. Filled in by RequestParser, the
// path by RequestDecoder and the peer address by Connection.
struct Request {
    friend class Connection;
    friend class RequestParser;

    std::string method_;
    std::string uri_;
    int httpVersionMajor_ = 0;
    int httpVersionMinor_ = 0;
    std::vector<Header> headers_;
    bool keepAlive_ = true;

    // uri_ percent-decoded, without the query string.
    std::string requestPath_;

    // Body bytes, empty when the body was larger than the parser keeps.
    std::vector<char> body_;

    // e.g. "127.0.0.1"
    std::string remoteAddress_;

    // case insensitive
    std::string getHeaderValue(const std::string &name) const {
        auto it = std::find_if(headers_.begin(), headers_.end(), [&](const Header &h) {
            return iequals(h.name_, name);
        });
        return it != headers_.end() ? it->value_ : std::string();
    }

    bool hasContentLength() const {
        return contentLength_ != noContentLength;
    }

    size_t getContentLength() const {
        return hasContentLength() ? contentLength_ : 0;
    }

    bool isChunked() const {
        return isChunked_;
    }

   private:
    static constexpr size_t noContentLength = std::numeric_limits<size_t>::max();

    // Ready for the next request on the same connection.
    void reset() {
        std::string remoteAddress = std::move(remoteAddress_);
        *this = Request();
        remoteAddress_ = std::move(remoteAddress);
    }

    size_t contentLength_ = noContentLength;
    bool isChunked_ = false;
};

}  // namespace ludo
