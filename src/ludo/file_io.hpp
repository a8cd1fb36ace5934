#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ludo/i_file_io.hpp"

namespace ludo {

// Serves files from local directories mounted at URL prefixes.
class FileIO : public IFileIO {
   public:
    FileIO() = default;
    virtual ~FileIO() = default;

    // Serve files below root for request paths starting with urlPrefix, the
    // prefix is stripped before the path is resolved against root. With
    // exactOnly the mount answers only the request path equal to urlPrefix.
    void addMount(const std::string &urlPrefix, const std::string &root, bool exactOnly = false);

    size_t openFile(unsigned connectionId, const Request &request, Reply &reply) override;
    size_t readFile(unsigned connectionId, char *buf, size_t maxSize) override;
    void closeFile(unsigned connectionId) override;

   private:
    struct Mount {
        std::string prefix_;
        std::string root_;
        bool exactOnly_;
    };

    const Mount *findMount(const std::string &requestPath) const;

    std::vector<Mount> mounts_;

    // Guarded by mutex_, connections on several io threads may read at once.
    std::unordered_map<unsigned, std::ifstream> openFiles_;
    std::mutex mutex_;
};

}  // namespace ludo
