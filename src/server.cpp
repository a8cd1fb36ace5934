#include <signal.h>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "ludo/server.hpp"

namespace ludo {

namespace {

size_t checkedContentSize(size_t maxContentSize) {
    if (maxContentSize < 1024) {
        throw std::invalid_argument("maxContentSize must be at least 1024 bytes, got " +
                                    std::to_string(maxContentSize));
    }
    return maxContentSize;
}

}  // namespace

Server::Server(asio::io_context &ioContext,
               const std::string &address,
               const std::string &port,
               const Settings &settings,
               size_t maxContentSize)
    : settings_(settings),
      maxContentSize_(checkedContentSize(maxContentSize)),
      requestHandler_(maxContentSize_),
      connectionManager_(settings_, requestHandler_, log_, maxContentSize_),
      acceptor_(ioContext),
      signals_(ioContext, SIGINT, SIGTERM),
      tickTimer_(ioContext) {
#if defined(SIGQUIT)
    signals_.add(SIGQUIT);
#endif
    waitForSignal();
    listen(ioContext, address, port);
    acceptNext();
    scheduleTick();
}

void Server::listen(asio::io_context &ioContext,
                    const std::string &address,
                    const std::string &port) {
    asio::ip::tcp::resolver resolver(ioContext);
    const asio::ip::tcp::endpoint endpoint = *resolver.resolve(address, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

uint16_t Server::getBindedPort() const {
    return acceptor_.local_endpoint().port();
}

void Server::setFileIO(IFileIO *fileIO) {
    requestHandler_.setFileIO(fileIO);
}

void Server::addRequestHandler(const handlerCallback &cb) {
    requestHandler_.addRequestHandler(cb);
}

void Server::setDebugMsgHandler(const debugMsgCallback &cb) {
    log_.debugMsg_ = cb;
}

void Server::setAccessLogHandler(const accessLogCallback &cb) {
    log_.accessLog_ = cb;
}

void Server::acceptNext() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        // Closed by a signal while the accept was pending.
        if (!acceptor_.is_open()) {
            return;
        }
        if (ec) {
            log_.debug("acceptNext: " + ec.message() + ':' + std::to_string(ec.value()));
        } else {
            connectionManager_.accept(std::move(socket));
        }
        acceptNext();
    });
}

void Server::waitForSignal() {
    signals_.async_wait([this](std::error_code ec, int signo) {
        if (ec) {
            return;
        }
        log_.debug("Stopping on signal " + std::to_string(signo));
        tickTimer_.cancel();
        std::error_code ignored;
        acceptor_.close(ignored);
        connectionManager_.stopAll();
    });
}

void Server::scheduleTick() {
    tickTimer_.expires_after(std::chrono::seconds(1));
    tickTimer_.async_wait([this](std::error_code ec) {
        if (ec) {
            return;
        }
        connectionManager_.tick();
        scheduleTick();
    });
}

}  // namespace ludo
