#pragma once

#include <string>

#include "ludo/request.hpp"

namespace ludo {

class RequestDecoder {
   public:
    RequestDecoder() = default;
    virtual ~RequestDecoder() = default;

    // Set requestPath_ from uri_, percent-decoded and without the query
    // string. Returns false for paths that are not absolute or contain "..".
    bool decodeRequest(Request &req);

   private:
    std::string urlDecode(const std::string &in);
};

}  // namespace ludo
