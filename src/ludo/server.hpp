#pragma once

#include <asio.hpp>
#include <cstdint>
#include <string>

#include "ludo/connection_manager.hpp"
#include "ludo/i_file_io.hpp"
#include "ludo/ludo_common.hpp"
#include "ludo/request_handler.hpp"

namespace ludo {

// HTTP/1.x server on an io_context supplied by the caller. Listening starts
// in the constructor; the server stops accepting and closes its connections
// on SIGINT, SIGTERM or SIGQUIT.
class Server {
   public:
    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Port "0" picks a free port, see getBindedPort(). maxContentSize is the
    // socket buffer size and the largest request body kept; it must be at
    // least 1024 (std::invalid_argument). Bind errors throw std::system_error.
    Server(asio::io_context &ioContext,
           const std::string &address,
           const std::string &port,
           const Settings &settings,
           size_t maxContentSize = 1024);

    uint16_t getBindedPort() const;

    void setFileIO(IFileIO *fileIO);
    void addRequestHandler(const handlerCallback &cb);
    void setDebugMsgHandler(const debugMsgCallback &cb);
    void setAccessLogHandler(const accessLogCallback &cb);

   private:
    void listen(asio::io_context &ioContext, const std::string &address, const std::string &port);
    void acceptNext();
    void waitForSignal();
    void scheduleTick();

    const Settings settings_;
    const size_t maxContentSize_;
    ServerLog log_;
    RequestHandler requestHandler_;
    ConnectionManager connectionManager_;

    asio::ip::tcp::acceptor acceptor_;
    asio::signal_set signals_;
    asio::steady_timer tickTimer_;
};

}  // namespace ludo
