#pragma once

#include <cstring>
#include <functional>
#include <string>
#include <vector>

#include "cJSON.h"
#include "ludo/reply.hpp"

namespace ludo {

// Writes a reply body into Reply::content_, either as text streamed with '<<'
// or as a cJSON tree rendered without whitespace.
class HttpResult {
   public:
    explicit HttpResult(std::vector<char>& body) : body_(body) {}
    HttpResult(const HttpResult&) = delete;
    HttpResult& operator=(const HttpResult&) = delete;

    HttpResult& operator<<(const std::string& text) {
        body_.insert(body_.end(), text.begin(), text.end());
        return *this;
    }

    // Replaces the body with root, which is freed. A null tree, or one cJSON
    // fails to render, leaves the body empty.
    void setJsonResponse(cJSON* root) {
        body_.clear();
        if (root == nullptr) {
            return;
        }
        char* text = cJSON_PrintUnformatted(root);
        cJSON_Delete(root);
        if (text != nullptr) {
            body_.assign(text, text + std::strlen(text));
            cJSON_free(text);
        }
    }

    void buildJsonResponse(const std::function<cJSON*()>& builder) {
        setJsonResponse(builder());
    }

    // {"error":"<message>"}, to be sent with statusCode_.
    void jsonError(Reply::status_type statusCode, const std::string& message) {
        statusCode_ = statusCode;
        cJSON* root = cJSON_CreateObject();
        cJSON_AddStringToObject(root, "error", message.c_str());
        setJsonResponse(root);
    }

    Reply::status_type statusCode_ = Reply::ok;

   private:
    std::vector<char>& body_;
};

}  // namespace ludo
