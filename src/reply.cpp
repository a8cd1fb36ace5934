#include <algorithm>
#include <string>

#include "ludo/reply.hpp"

namespace ludo {

namespace {

struct StatusText {
    Reply::status_type status_;
    std::string reason_;
    // e.g. "HTTP/1.1 404 Not Found\r\n"
    std::string line_;
};

StatusText makeStatusText(Reply::status_type status, const std::string& reason) {
    return {status,
            reason,
            "HTTP/1.1 " + std::to_string(static_cast<int>(status)) + " " + reason + "\r\n"};
}

// The first entry also stands in for values outside the enum.
const std::vector<StatusText>& statusTexts() {
    static const std::vector<StatusText> texts = {
        makeStatusText(Reply::internal_server_error, "Internal Server Error"),
        makeStatusText(Reply::ok, "OK"),
        makeStatusText(Reply::bad_request, "Bad Request"),
        makeStatusText(Reply::not_found, "Not Found"),
        makeStatusText(Reply::method_not_allowed, "Method Not Allowed"),
        makeStatusText(Reply::version_not_supported, "HTTP Version Not Supported"),
    };
    return texts;
}

const StatusText& statusText(Reply::status_type status) {
    const auto& texts = statusTexts();
    auto it = std::find_if(texts.begin(), texts.end(), [status](const StatusText& t) {
        return t.status_ == status;
    });
    return it != texts.end() ? *it : texts.front();
}

const char fieldSeparator[] = {':', ' '};
const char crlf[] = {'\r', '\n'};

}  // namespace

Reply::Reply(std::vector<char>& content) : content_(content) {
    headers_.reserve(4);
}

void Reply::reset() {
    content_.clear();
    filePath_.clear();
    fileExtension_.clear();
    headers_.clear();
    status_ = ok;
    returnToClient_ = false;
    replyPartial_ = false;
    finalPart_ = false;
}

void Reply::addHeader(const std::string& name, const std::string& val) {
    headers_.push_back({name, val});
}

bool Reply::hasHeader(const std::string& name) const {
    return std::any_of(headers_.begin(), headers_.end(), [&name](const Header& h) {
        return iequals(h.name_, name);
    });
}

void Reply::send(status_type status) {
    content_.clear();
    send(status, "");
}

void Reply::send(status_type status, const std::string& contentType) {
    status_ = status;
    addHeader("Content-Length", std::to_string(content_.size()));
    if (!contentType.empty()) {
        addHeader("Content-Type", contentType);
    }
    returnToClient_ = true;
}

void Reply::stockReply(const Request& req, status_type status) {
    const StatusText& text = statusText(status);
    const std::string body = "{\"status\":" + std::to_string(static_cast<int>(status)) +
                             ",\"message\":\"" + text.reason_ + "\"}";

    headers_.clear();
    content_.assign(body.begin(), body.end());
    send(status, "application/json");
    if (status != ok) {
        addHeader("Connection", "close");
    }
    if (req.method_ == "HEAD") {
        content_.clear();
    }
}

std::vector<asio::const_buffer> Reply::headerToBuffers() const {
    std::vector<asio::const_buffer> buffers;
    buffers.reserve(headers_.size() * 4 + 2);

    buffers.push_back(asio::buffer(statusText(status_).line_));
    for (const Header& h : headers_) {
        buffers.push_back(asio::buffer(h.name_));
        buffers.push_back(asio::buffer(fieldSeparator));
        buffers.push_back(asio::buffer(h.value_));
        buffers.push_back(asio::buffer(crlf));
    }
    buffers.push_back(asio::buffer(crlf));
    return buffers;
}

std::vector<asio::const_buffer> Reply::contentToBuffers() const {
    return {asio::buffer(content_)};
}

}  // namespace ludo
