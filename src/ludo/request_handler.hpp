#pragma once

#include <cstddef>
#include <vector>

#include "ludo/i_file_io.hpp"
#include "ludo/ludo_common.hpp"
#include "ludo/reply.hpp"
#include "ludo/request.hpp"

namespace ludo {

// Offers each request to the added handlers in order, the first one sending a
// reply wins. GET and HEAD requests nobody answered are served from IFileIO,
// anything else gets a stock 404.
class RequestHandler {
   public:
    RequestHandler(const RequestHandler &) = delete;
    RequestHandler &operator=(const RequestHandler &) = delete;

    // Files are sent in parts of at most partSize bytes.
    explicit RequestHandler(size_t partSize);

    void setFileIO(IFileIO *fileIO);
    void addRequestHandler(const handlerCallback &cb);

    void handleRequest(unsigned connectionId, const Request &req, Reply &rep);

    // Replace rep.content_ with the next part of the file being sent. Sets
    // finalPart_ and closes the file once it is used up.
    void readNextPart(unsigned connectionId, Reply &rep);

    void closeFile(unsigned connectionId);

   private:
    void serveFile(unsigned connectionId, const Request &req, Reply &rep);

    const size_t partSize_;
    IFileIO *fileIO_ = nullptr;
    std::vector<handlerCallback> handlers_;
};

}  // namespace ludo
