#pragma once

#include <asio.hpp>
#include <string>
#include <vector>

#include "ludo/header.hpp"
#include "ludo/request.hpp"

namespace ludo {

// Status, headers and body going back for one request. Handlers fill it in
// and call send(); the connection then writes it out, streaming file content
// in several parts when it does not fit in one buffer.
class Reply {
    friend class RequestHandler;
    friend class Connection;

   public:
    Reply(const Reply&) = delete;
    Reply& operator=(const Reply&) = delete;

    explicit Reply(std::vector<char>& content);
    virtual ~Reply() = default;

    // The statuses ludo answers with.
    enum status_type {
        ok = 200,
        bad_request = 400,
        not_found = 404,
        method_not_allowed = 405,
        internal_server_error = 500,
        version_not_supported = 505
    };

    // Body, owned by the connection.
    std::vector<char>& content_;

    // Request path, made relative to its mount by IFileIO.
    std::string filePath_;
    std::string fileExtension_;

    // Send without body.
    void send(status_type status);

    // Send content_ as body.
    void send(status_type status, const std::string& contentType);

    void addHeader(const std::string& name, const std::string& val);
    bool hasHeader(const std::string& name) const;

    // Replace anything set so far with {"status":N,"message":"<reason>"}.
    void stockReply(const Request& req, status_type status);

    bool isSent() const {
        return returnToClient_;
    }

#ifdef LUDO_ENABLE_TESTING
    status_type getStatus() const {
        return status_;
    }

    const std::vector<Header>& getHeaders() const {
        return headers_;
    }

    std::string getHeaderValue(const std::string& headerName) const {
        for (const auto& header : headers_) {
            if (iequals(header.name_, headerName)) {
                return header.value_;
            }
        }
        return "";
    }

    std::string getContent() const {
        return std::string(content_.begin(), content_.end());
    }
#endif

   private:
    void reset();

    status_type status_ = ok;
    std::vector<Header> headers_;

    bool returnToClient_ = false;

    // Content is written in parts, finalPart_ marks the last one.
    bool replyPartial_ = false;
    bool finalPart_ = false;

    // Views into the reply, valid until it is reset or changed.
    std::vector<asio::const_buffer> headerToBuffers() const;
    std::vector<asio::const_buffer> contentToBuffers() const;
};

}  // namespace ludo
