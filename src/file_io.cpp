#include <algorithm>
#include <filesystem>
#include <system_error>

#include "ludo/file_io.hpp"
#include "ludo/http_result.hpp"

namespace fs = std::filesystem;

namespace ludo {

void FileIO::addMount(const std::string &urlPrefix, const std::string &root, bool exactOnly) {
    mounts_.push_back({urlPrefix, root, exactOnly});
}

const FileIO::Mount *FileIO::findMount(const std::string &requestPath) const {
    const Mount *best = nullptr;
    for (const auto &mount : mounts_) {
        bool match = mount.exactOnly_ ? requestPath == mount.prefix_
                                      : requestPath.rfind(mount.prefix_, 0) == 0;
        if (match && (best == nullptr || mount.prefix_.size() > best->prefix_.size())) {
            best = &mount;
        }
    }
    return best;
}

size_t FileIO::openFile(unsigned connectionId, const Request &req, Reply &reply) {
    HttpResult res(reply.content_);

    const Mount *mount = findMount(req.requestPath_);
    if (mount == nullptr) {
        res.jsonError(Reply::not_found, "Not found: " + req.requestPath_);
        reply.send(res.statusCode_, "application/json");
        return 0;
    }

    // filePath_ starts with the request path, possibly with index.html appended.
    std::string relative =
        reply.filePath_.substr(std::min(mount->prefix_.size(), reply.filePath_.size()));
    while (!relative.empty() && relative[0] == '/') {
        relative = relative.substr(1);
    }
    if (relative.empty()) {
        relative = "index.html";
        reply.fileExtension_ = "html";
    }
    reply.filePath_ = relative;

    if (relative == "index.html") {
        reply.addHeader("Cache-Control", "no-cache, no-store, must-revalidate, max-age=0");
    }

    fs::path fullPath = fs::path(mount->root_) / relative;

    std::error_code ec;
    if (!fs::is_regular_file(fullPath, ec)) {
        res.jsonError(Reply::not_found, "Could not read file: " + relative);
        reply.send(res.statusCode_, "application/json");
        return 0;
    }

    size_t fileSize = fs::file_size(fullPath, ec);
    if (ec) {
        res.jsonError(Reply::internal_server_error, "Unexpected error occured: " + ec.message());
        reply.send(res.statusCode_, "application/json");
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream &is = openFiles_[connectionId];
    is.open(fullPath, std::ios::in | std::ios::binary);
    if (!is.is_open()) {
        openFiles_.erase(connectionId);
        res.jsonError(Reply::internal_server_error, "Could not open file: " + relative);
        reply.send(res.statusCode_, "application/json");
        return 0;
    }

    return fileSize;
}

size_t FileIO::readFile(unsigned connectionId, char *buf, size_t maxSize) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = openFiles_.find(connectionId);
    if (it == openFiles_.end()) {
        return 0;
    }
    it->second.read(buf, static_cast<std::streamsize>(maxSize));
    return static_cast<size_t>(it->second.gcount());
}

void FileIO::closeFile(unsigned connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    openFiles_.erase(connectionId);
}

}  // namespace ludo
