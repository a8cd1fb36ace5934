#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "ludo/ludo_common.hpp"

namespace ludo {

// Writes one Common Log Format line per request, e.g.
// 127.0.0.1 - - [19/Oct/2026:10:02:03 +0200] "GET /status HTTP/1.1" 200 21
class AccessLog {
   public:
    explicit AccessLog(std::ostream &os);
    AccessLog(const AccessLog &) = delete;
    AccessLog &operator=(const AccessLog &) = delete;

    void write(const AccessEntry &entry);

    // Adapter for Server::setAccessLogHandler.
    accessLogCallback callback();

    // The line for entry, without trailing newline. Time in local time zone.
    static std::string format(const AccessEntry &entry);

   private:
    std::ostream &os_;
    std::mutex mutex_;
};

}  // namespace ludo
