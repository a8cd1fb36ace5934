#include <string>
#include <utility>

#include "ludo/connection.hpp"
#include "ludo/connection_manager.hpp"

namespace ludo {

namespace {

std::string describe(const char *where, const std::error_code &ec) {
    return std::string(where) + ": " + ec.message() + ':' + std::to_string(ec.value());
}

}  // namespace

Connection::Connection(asio::ip::tcp::socket socket,
                       ConnectionManager &manager,
                       unsigned id,
                       size_t maxContentSize)
    : socket_(std::move(socket)),
      manager_(manager),
      requestHandler_(manager.requestHandler()),
      log_(manager.log()),
      id_(id),
      maxContentSize_(maxContentSize),
      recvBuffer_(maxContentSize),
      requestParser_(maxContentSize),
      reply_(sendBuffer_) {
    sendBuffer_.reserve(maxContentSize);
}

void Connection::start(const KeepAlive &keepAlive) {
    keepAlive_ = keepAlive;
    lastActivity_ = std::chrono::steady_clock::now();

    std::error_code ec;
    auto peer = socket_.remote_endpoint(ec);
    if (ec) {
        log_.debug(describe("remote_endpoint", ec));
    } else {
        request_.remoteAddress_ = peer.address().to_string();
    }
    readRequest();
}

void Connection::stop() {
    std::error_code ignored;
    socket_.close(ignored);
}

std::string Connection::expiryReason(std::chrono::steady_clock::time_point now) const {
    if (!keepAlive_.enabled_ || !request_.keepAlive_) {
        return "";
    }
    if (now > lastActivity_ + keepAlive_.timeout_) {
        return "inactivity";
    }
    if (requestCount_ >= keepAlive_.maxRequests_) {
        return "max request limit";
    }
    return "";
}

void Connection::readRequest() {
    auto self(shared_from_this());
    // The read size is taken from the buffer size.
    recvBuffer_.resize(maxContentSize_);
    socket_.async_read_some(asio::buffer(recvBuffer_),
                            [this, self](std::error_code ec, std::size_t n) {
                                if (ec) {
                                    if (ec == asio::error::operation_aborted) {
                                        return;
                                    }
                                    if (ec != asio::error::eof) {
                                        log_.debug(describe("readRequest", ec));
                                    }
                                    shutdown();
                                    return;
                                }
                                lastActivity_ = std::chrono::steady_clock::now();
                                recvBuffer_.resize(n);
                                onParsed(requestParser_.parse(request_, recvBuffer_));
                            });
}

void Connection::onParsed(RequestParser::result_type result) {
    switch (result) {
        case RequestParser::indeterminate:
            readRequest();
            return;
        case RequestParser::good_complete:
            requestTime_ = std::chrono::system_clock::now();
            if (requestDecoder_.decodeRequest(request_)) {
                requestHandler_.handleRequest(id_, request_, reply_);
            } else {
                reply_.stockReply(request_, Reply::bad_request);
            }
            break;
        case RequestParser::version_not_supported:
            requestTime_ = std::chrono::system_clock::now();
            reply_.stockReply(request_, Reply::version_not_supported);
            break;
        case RequestParser::bad:
        default:
            requestTime_ = std::chrono::system_clock::now();
            reply_.stockReply(request_, Reply::bad_request);
            break;
    }
    writeHeaders();
}

void Connection::negotiateConnection() {
    ++requestCount_;

    // A handler or stock reply may already have asked to close.
    for (const Header &h : reply_.headers_) {
        if (iequals(h.name_, "Connection") && iequals(h.value_, "close")) {
            closeAfterReply_ = true;
            return;
        }
    }

    const bool keepOpen =
        keepAlive_.enabled_ && request_.keepAlive_ && requestCount_ < keepAlive_.maxRequests_;
    if (!keepOpen) {
        reply_.addHeader("Connection", "close");
        closeAfterReply_ = true;
        return;
    }

    // max counts the requests still allowed after this one.
    reply_.addHeader("Connection", "keep-alive");
    reply_.addHeader("Keep-Alive",
                     "timeout=" + std::to_string(keepAlive_.timeout_.count()) +
                         ", max=" + std::to_string(keepAlive_.maxRequests_ - requestCount_));
}

void Connection::writeHeaders() {
    negotiateConnection();
    bytesWritten_ = 0;

    auto self(shared_from_this());
    asio::async_write(socket_, reply_.headerToBuffers(), [this, self](std::error_code ec, size_t) {
        if (ec) {
            writeFailed("writeHeaders", ec);
            return;
        }
        lastActivity_ = std::chrono::steady_clock::now();
        if (reply_.content_.empty()) {
            replyWritten();
        } else {
            writeContent();
        }
    });
}

void Connection::writeContent() {
    auto self(shared_from_this());
    asio::async_write(
        socket_, reply_.contentToBuffers(), [this, self](std::error_code ec, size_t n) {
            if (ec) {
                writeFailed("writeContent", ec);
                return;
            }
            lastActivity_ = std::chrono::steady_clock::now();
            bytesWritten_ += n;

            if (!reply_.replyPartial_ || reply_.finalPart_) {
                replyWritten();
                return;
            }
            // Next part of a streamed file.
            requestHandler_.readNextPart(id_, reply_);
            if (reply_.content_.empty()) {
                replyWritten();
            } else {
                writeContent();
            }
        });
}

void Connection::replyWritten() {
    logAccess();

    requestParser_.reset();
    request_.reset();
    reply_.reset();

    if (closeAfterReply_) {
        shutdown();
    } else {
        readRequest();
    }
}

void Connection::writeFailed(const char *where, const std::error_code &ec) {
    if (ec != asio::error::operation_aborted) {
        log_.debug(describe(where, ec));
    }
    logAccess();
    shutdown();
}

void Connection::logAccess() {
    AccessEntry entry;
    entry.remoteAddress_ = request_.remoteAddress_;
    entry.time_ = requestTime_;
    entry.method_ = request_.method_.empty() ? "-" : request_.method_;
    entry.uri_ = request_.uri_.empty() ? "-" : request_.uri_;
    // A request line too broken to carry a version is logged as HTTP/1.1.
    if (request_.httpVersionMajor_ > 0) {
        entry.httpVersionMajor_ = request_.httpVersionMajor_;
        entry.httpVersionMinor_ = request_.httpVersionMinor_;
    }
    entry.status_ = static_cast<int>(reply_.status_);
    entry.size_ = bytesWritten_;
    log_.access(entry);
}

void Connection::shutdown() {
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    requestHandler_.closeFile(id_);
    manager_.stop(shared_from_this());
}

}  // namespace ludo
