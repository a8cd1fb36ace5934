#include <ctime>
#include <iomanip>
#include <sstream>

#include "ludo/access_log.hpp"

namespace ludo {

AccessLog::AccessLog(std::ostream &os) : os_(os) {}

void AccessLog::write(const AccessEntry &entry) {
    const std::string line = format(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    os_ << line << '\n';
    os_.flush();
    // keep logging after a stream error
    os_.clear();
}

accessLogCallback AccessLog::callback() {
    return [this](const AccessEntry &entry) { write(entry); };
}

std::string AccessLog::format(const AccessEntry &entry) {
    std::time_t t = std::chrono::system_clock::to_time_t(entry.time_);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << (entry.remoteAddress_.empty() ? "-" : entry.remoteAddress_) << " - - ["
        << std::put_time(&tm, "%d/%b/%Y:%H:%M:%S %z") << "] \"" << entry.method_ << ' '
        << entry.uri_ << " HTTP/" << entry.httpVersionMajor_ << '.' << entry.httpVersionMinor_
        << "\" " << entry.status_ << ' ' << entry.size_;
    return oss.str();
}

}  // namespace ludo
