#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "ludo/reply.hpp"
#include "ludo/request.hpp"

namespace ludo {

using handlerCallback = std::function<void(const Request &req, Reply &rep)>;

using debugMsgCallback = std::function<void(const std::string &msg)>;

// What is known about a request once its reply has been written.
struct AccessEntry {
    std::string remoteAddress_;
    std::chrono::system_clock::time_point time_;
    std::string method_;
    std::string uri_;
    int httpVersionMajor_ = 1;
    int httpVersionMinor_ = 1;
    int status_ = 0;
    size_t size_ = 0;
};

using accessLogCallback = std::function<void(const AccessEntry &entry)>;

// Where a server reports diagnostics and written replies. Unset callbacks
// drop the report.
struct ServerLog {
    debugMsgCallback debugMsg_;
    accessLogCallback accessLog_;

    void debug(const std::string &msg) const {
        if (debugMsg_) {
            debugMsg_(msg);
        }
    }

    void access(const AccessEntry &entry) const {
        if (accessLog_) {
            accessLog_(entry);
        }
    }
};

struct Settings {
    Settings(std::chrono::seconds keepAliveTimeout = std::chrono::seconds(5),
             size_t keepAliveMax = 100,
             size_t connectionLimit = 0)
        : keepAliveTimeout_(keepAliveTimeout),
          keepAliveMax_(keepAliveMax),
          connectionLimit_(connectionLimit) {}

    // Keep-Alive timeout for inactive connections. Sent in Keep-Alive response header.
    // 0s = Keep-Alive disabled.
    std::chrono::seconds keepAliveTimeout_;

    // Max number of request that can be processed on the connection before it is closed.
    size_t keepAliveMax_;

    // Number of persistent connections allowed, connections above the limit
    // get Connection: close. 0 = no limit.
    size_t connectionLimit_;
};

}  // namespace ludo
