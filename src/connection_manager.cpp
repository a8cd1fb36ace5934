#include <chrono>
#include <string>
#include <utility>

#include "ludo/connection_manager.hpp"

namespace ludo {

ConnectionManager::ConnectionManager(const Settings& settings,
                                     RequestHandler& requestHandler,
                                     const ServerLog& log,
                                     size_t maxContentSize)
    : settings_(settings),
      requestHandler_(requestHandler),
      log_(log),
      maxContentSize_(maxContentSize) {}

void ConnectionManager::accept(asio::ip::tcp::socket socket) {
    const unsigned id = nextId_++;
    auto c = std::make_shared<Connection>(std::move(socket), *this, id, maxContentSize_);
    connections_[id] = c;
    c->start(keepAliveForNext());
}

// Connections beyond connectionLimit_ are served once and closed.
KeepAlive ConnectionManager::keepAliveForNext() const {
    KeepAlive keepAlive;
    keepAlive.timeout_ = settings_.keepAliveTimeout_;
    keepAlive.maxRequests_ = settings_.keepAliveMax_;
    keepAlive.enabled_ =
        settings_.keepAliveTimeout_.count() > 0 &&
        (settings_.connectionLimit_ == 0 || connections_.size() <= settings_.connectionLimit_);
    return keepAlive;
}

void ConnectionManager::stop(const std::shared_ptr<Connection>& c) {
    // c may be the last owner once erased
    auto keep = c;
    connections_.erase(keep->id());
    keep->stop();
}

void ConnectionManager::stopAll() {
    for (auto& entry : connections_) {
        entry.second->stop();
    }
    connections_.clear();
}

void ConnectionManager::tick() {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = connections_.begin(); it != connections_.end();) {
        std::string reason = it->second->expiryReason(now);
        if (reason.empty()) {
            ++it;
            continue;
        }
        log_.debug("Removing connection " + std::to_string(it->first) + " due to " + reason);
        it->second->stop();
        it = connections_.erase(it);
    }
}

}  // namespace ludo
