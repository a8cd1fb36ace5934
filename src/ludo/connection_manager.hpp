#pragma once

#include <asio.hpp>
#include <map>
#include <memory>

#include "ludo/connection.hpp"
#include "ludo/ludo_common.hpp"
#include "ludo/request_handler.hpp"

namespace ludo {

// Owns the open connections, keyed by connection id, so they can be expired
// on tick and all closed when the server stops.
class ConnectionManager {
   public:
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    ConnectionManager(const Settings& settings,
                      RequestHandler& requestHandler,
                      const ServerLog& log,
                      size_t maxContentSize);

    // Wrap an accepted socket in a Connection and start reading.
    void accept(asio::ip::tcp::socket socket);

    void stop(const std::shared_ptr<Connection>& c);
    void stopAll();

    // Close keep-alive connections that idled too long or used up their
    // requests.
    void tick();

    size_t size() const {
        return connections_.size();
    }

    RequestHandler& requestHandler() {
        return requestHandler_;
    }

    const ServerLog& log() const {
        return log_;
    }

   private:
    KeepAlive keepAliveForNext() const;

    const Settings& settings_;
    RequestHandler& requestHandler_;
    const ServerLog& log_;
    const size_t maxContentSize_;

    std::map<unsigned, std::shared_ptr<Connection>> connections_;
    unsigned nextId_ = 0;
};

}  // namespace ludo
