#pragma once

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "ludo/ludo_common.hpp"
#include "ludo/reply.hpp"
#include "ludo/request.hpp"
#include "ludo/request_decoder.hpp"
#include "ludo/request_handler.hpp"
#include "ludo/request_parser.hpp"

namespace ludo {

class ConnectionManager;

// Keep-alive terms a connection is granted when it is accepted.
struct KeepAlive {
    bool enabled_ = false;
    std::chrono::seconds timeout_{0};
    size_t maxRequests_ = 0;
};

// One client socket. Reads a request, hands it to the RequestHandler, writes
// the reply and reports it to the access log, then reads the next request or
// closes depending on keep-alive.
class Connection : public std::enable_shared_from_this<Connection> {
   public:
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    Connection(asio::ip::tcp::socket socket,
               ConnectionManager &manager,
               unsigned id,
               size_t maxContentSize);

    void start(const KeepAlive &keepAlive);
    void stop();

    unsigned id() const {
        return id_;
    }

    // Why an idle keep-alive connection should be dropped at `now`, empty
    // while it may stay open.
    std::string expiryReason(std::chrono::steady_clock::time_point now) const;

   private:
    void readRequest();
    void onParsed(RequestParser::result_type result);

    void writeHeaders();
    void writeContent();
    void replyWritten();

    // Add Connection and Keep-Alive headers, decide whether to close after
    // the reply.
    void negotiateConnection();

    // The reply could not be written completely.
    void writeFailed(const char *where, const std::error_code &ec);

    void logAccess();
    void shutdown();

    asio::ip::tcp::socket socket_;
    ConnectionManager &manager_;
    RequestHandler &requestHandler_;
    const ServerLog &log_;
    const unsigned id_;
    const size_t maxContentSize_;

    std::vector<char> recvBuffer_;
    std::vector<char> sendBuffer_;

    Request request_;
    RequestParser requestParser_;
    RequestDecoder requestDecoder_;
    Reply reply_;

    KeepAlive keepAlive_;
    size_t requestCount_ = 0;
    bool closeAfterReply_ = false;

    std::chrono::steady_clock::time_point lastActivity_;

    // For the access log: when the request was read and body bytes written.
    std::chrono::system_clock::time_point requestTime_;
    size_t bytesWritten_ = 0;
};

}  // namespace ludo
