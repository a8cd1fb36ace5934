#pragma once

#include <cstddef>

#include "ludo/reply.hpp"
#include "ludo/request.hpp"

namespace ludo {

// Files for GET and HEAD requests no handler answered. A connection has at
// most one file open at a time, identified by its connection id.
class IFileIO {
   public:
    IFileIO() = default;
    virtual ~IFileIO() = default;

    // Open the file named by reply.filePath_ and return its size. On failure
    // send an error reply on reply instead and return 0.
    virtual size_t openFile(unsigned connectionId, const Request &request, Reply &reply) = 0;

    // Copy the next bytes of the open file to buf. Returns the number copied,
    // 0 at the end of the file or when nothing is open.
    virtual size_t readFile(unsigned connectionId, char *buf, size_t maxSize) = 0;

    // Closing a connection without an open file does nothing.
    virtual void closeFile(unsigned connectionId) = 0;
};

}  // namespace ludo
