#include <limits>
#include <string>

#include "ludo/parse_common.hpp"
#include "ludo/request.hpp"
#include "ludo/request_parser.hpp"

namespace ludo {

namespace {

const char versionPrefix[] = "HTTP/";
const size_t versionPrefixSize = sizeof(versionPrefix) - 1;

bool isTokenChar(char c) {
    return isChar(c) && !isCtl(c) && !isTsspecial(c);
}

// Methods that never carry a body.
bool isBodiless(const std::string &method) {
    return method == "GET" || method == "HEAD" || method == "DELETE" || method == "OPTIONS" ||
           method == "TRACE";
}

int digitValue(char c) {
    return c - '0';
}

// Content-Length is 1*DIGIT. Returns false on anything else or overflow.
bool parseContentLength(const std::string &value, size_t &length) {
    if (value.empty()) {
        return false;
    }
    size_t result = 0;
    for (char c : value) {
        if (!isDigit(c) || result > (std::numeric_limits<size_t>::max() - 9) / 10) {
            return false;
        }
        result = result * 10 + static_cast<size_t>(digitValue(c));
    }
    length = result;
    return true;
}

}  // namespace

RequestParser::RequestParser(size_t maxBodySize) : maxBodySize_(maxBodySize) {}

void RequestParser::reset() {
    state_ = method_start;
    prefixMatched_ = 0;
    remaining_ = 0;
    badFraming_ = false;
    bodyDropped_ = false;
}

RequestParser::result_type RequestParser::parse(Request &req, const std::vector<char> &data) {
    for (char c : data) {
        result_type result = consume(req, c);
        if (result != indeterminate) {
            return result;
        }
    }
    return indeterminate;
}

RequestParser::result_type RequestParser::consume(Request &req, char input) {
    switch (state_) {
        // Request line: METHOD SP request-target SP HTTP/x.y CRLF
        case method_start:
        case method:
            if (input == ' ' && state_ == method) {
                state_ = uri_start;
                return indeterminate;
            }
            if (!isTokenChar(input)) {
                return bad;
            }
            req.method_.push_back(input);
            state_ = method;
            return indeterminate;
        case uri_start:
        case uri:
            if (input == ' ' && state_ == uri) {
                state_ = version_prefix;
                return indeterminate;
            }
            if (isCtl(input) || input == ' ') {
                return bad;
            }
            req.uri_.push_back(input);
            state_ = uri;
            return indeterminate;
        case version_prefix:
            if (input != versionPrefix[prefixMatched_]) {
                return bad;
            }
            if (++prefixMatched_ == versionPrefixSize) {
                req.httpVersionMajor_ = 0;
                req.httpVersionMinor_ = 0;
                state_ = version_major_start;
            }
            return indeterminate;
        case version_major_start:
        case version_major:
            if (input == '.' && state_ == version_major) {
                state_ = version_minor_start;
                return indeterminate;
            }
            if (!isDigit(input)) {
                return bad;
            }
            req.httpVersionMajor_ = req.httpVersionMajor_ * 10 + digitValue(input);
            state_ = version_major;
            return indeterminate;
        case version_minor_start:
        case version_minor:
            if (input == '\r' && state_ == version_minor) {
                state_ = request_line_lf;
                return indeterminate;
            }
            if (!isDigit(input)) {
                return bad;
            }
            req.httpVersionMinor_ = req.httpVersionMinor_ * 10 + digitValue(input);
            state_ = version_minor;
            return indeterminate;
        case request_line_lf:
            if (input != '\n') {
                return bad;
            }
            if (req.httpVersionMajor_ != 1 || req.httpVersionMinor_ > 1) {
                return version_not_supported;
            }
            // HTTP/1.1 connections are persistent unless the client says close.
            req.keepAlive_ = req.httpVersionMinor_ == 1;
            state_ = header_line_start;
            return indeterminate;

        // Header fields
        case header_line_start:
            if (input == '\r') {
                state_ = headers_end_lf;
            } else if ((input == ' ' || input == '\t') && !req.headers_.empty()) {
                state_ = header_lws;
            } else if (isTokenChar(input)) {
                req.headers_.push_back(Header());
                req.headers_.back().name_.push_back(input);
                state_ = header_name;
            } else {
                return bad;
            }
            return indeterminate;
        case header_lws:
            if (input == '\r') {
                onHeader(req);
                state_ = header_line_lf;
            } else if (isCtl(input) && input != '\t') {
                return bad;
            } else if (input != ' ' && input != '\t') {
                req.headers_.back().value_.push_back(input);
                state_ = header_value;
            }
            return indeterminate;
        case header_name:
            if (input == ':') {
                state_ = header_value_start;
            } else if (isTokenChar(input)) {
                req.headers_.back().name_.push_back(input);
            } else {
                return bad;
            }
            return indeterminate;
        case header_value_start:
        case header_value:
            if (input == '\r') {
                onHeader(req);
                state_ = header_line_lf;
            } else if ((input == ' ' || input == '\t') && state_ == header_value_start) {
                // optional whitespace before the value
            } else if (isCtl(input) && input != '\t') {
                return bad;
            } else {
                req.headers_.back().value_.push_back(input);
                state_ = header_value;
            }
            return indeterminate;
        case header_line_lf:
            if (input != '\n') {
                return bad;
            }
            state_ = header_line_start;
            return indeterminate;
        case headers_end_lf:
            if (input != '\n') {
                return bad;
            }
            return startBody(req);

        // Content-Length body
        case content:
            storeBody(req, input);
            return --remaining_ == 0 ? good_complete : indeterminate;

        default:
            return consumeChunked(req, input);
    }
}

RequestParser::result_type RequestParser::consumeChunked(Request &req, char input) {
    switch (state_) {
        case chunk_size_start:
        case chunk_size: {
            int digit = hexValue(input);
            if (digit >= 0) {
                if (remaining_ > (std::numeric_limits<size_t>::max() >> 4)) {
                    return bad;
                }
                remaining_ = remaining_ * 16 + static_cast<size_t>(digit);
                state_ = chunk_size;
            } else if (state_ == chunk_size_start) {
                return bad;
            } else if (input == '\r') {
                state_ = chunk_size_lf;
            } else if (input == ';' || input == ' ' || input == '\t') {
                state_ = chunk_ext;
            } else {
                return bad;
            }
            return indeterminate;
        }
        case chunk_ext:
            if (input == '\r') {
                state_ = chunk_size_lf;
            } else if (isCtl(input) && input != '\t') {
                return bad;
            }
            return indeterminate;
        case chunk_size_lf:
            if (input != '\n') {
                return bad;
            }
            // A zero sized chunk ends the body.
            state_ = remaining_ == 0 ? trailer_line_start : chunk_data;
            return indeterminate;
        case chunk_data:
            storeBody(req, input);
            if (--remaining_ == 0) {
                state_ = chunk_data_cr;
            }
            return indeterminate;
        case chunk_data_cr:
            if (input != '\r') {
                return bad;
            }
            state_ = chunk_data_lf;
            return indeterminate;
        case chunk_data_lf:
            if (input != '\n') {
                return bad;
            }
            state_ = chunk_size_start;
            return indeterminate;

        // Trailer fields are read and ignored.
        case trailer_line_start:
            if (input == '\r') {
                state_ = trailer_end_lf;
            } else if (isCtl(input)) {
                return bad;
            } else {
                state_ = trailer_line;
            }
            return indeterminate;
        case trailer_line:
            if (input == '\r') {
                state_ = trailer_line_lf;
            }
            return indeterminate;
        case trailer_line_lf:
            if (input != '\n') {
                return bad;
            }
            state_ = trailer_line_start;
            return indeterminate;
        case trailer_end_lf:
            return input == '\n' ? good_complete : bad;
        default:
            return bad;
    }
}

void RequestParser::onHeader(Request &req) {
    Header &h = req.headers_.back();
    while (!h.value_.empty() && (h.value_.back() == ' ' || h.value_.back() == '\t')) {
        h.value_.pop_back();
    }

    if (iequals(h.name_, "Content-Length")) {
        size_t length = 0;
        if (!parseContentLength(h.value_, length) ||
            (req.hasContentLength() && req.contentLength_ != length)) {
            badFraming_ = true;
            return;
        }
        req.contentLength_ = length;
    } else if (iequals(h.name_, "Transfer-Encoding")) {
        if (iequals(h.value_, "chunked")) {
            req.isChunked_ = true;
        } else {
            badFraming_ = true;
        }
    } else if (iequals(h.name_, "Connection")) {
        if (iequals(h.value_, "close")) {
            req.keepAlive_ = false;
        } else if (iequals(h.value_, "keep-alive")) {
            req.keepAlive_ = true;
        }
    }
}

RequestParser::result_type RequestParser::startBody(Request &req) {
    if (badFraming_) {
        return bad;
    }

    if (req.isChunked_) {
        if (req.hasContentLength() || isBodiless(req.method_)) {
            return bad;
        }
        remaining_ = 0;
        state_ = chunk_size_start;
        return indeterminate;
    }

    remaining_ = req.getContentLength();
    if (remaining_ == 0) {
        return good_complete;
    }
    if (isBodiless(req.method_)) {
        return bad;
    }

    bodyDropped_ = remaining_ > maxBodySize_;
    if (!bodyDropped_) {
        req.body_.reserve(remaining_);
    }
    state_ = content;
    return indeterminate;
}

void RequestParser::storeBody(Request &req, char input) {
    if (bodyDropped_) {
        return;
    }
    if (req.body_.size() >= maxBodySize_) {
        bodyDropped_ = true;
        req.body_.clear();
        return;
    }
    req.body_.push_back(input);
}

}  // namespace ludo
