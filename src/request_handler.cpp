#include <string>

#include "ludo/mime_types.hpp"
#include "ludo/request_handler.hpp"

namespace ludo {

namespace {

// "css" for "/static/css/style.css", empty when the last segment has no dot.
std::string extensionOf(const std::string &path) {
    const size_t dot = path.find_last_of('.');
    const size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return path.substr(dot + 1);
}

bool isRead(const Request &req) {
    return req.method_ == "GET" || req.method_ == "HEAD";
}

}  // namespace

RequestHandler::RequestHandler(size_t partSize) : partSize_(partSize) {}

void RequestHandler::setFileIO(IFileIO *fileIO) {
    fileIO_ = fileIO;
}

void RequestHandler::addRequestHandler(const handlerCallback &cb) {
    handlers_.push_back(cb);
}

void RequestHandler::handleRequest(unsigned connectionId, const Request &req, Reply &rep) {
    for (const auto &handler : handlers_) {
        handler(req, rep);
        if (rep.isSent()) {
            // Content-Length stays as computed for GET.
            if (req.method_ == "HEAD") {
                rep.content_.clear();
            }
            return;
        }
    }

    if (fileIO_ != nullptr && isRead(req)) {
        serveFile(connectionId, req, rep);
    } else {
        rep.stockReply(req, Reply::not_found);
    }
}

void RequestHandler::serveFile(unsigned connectionId, const Request &req, Reply &rep) {
    rep.filePath_ = req.requestPath_;
    if (rep.filePath_.empty() || rep.filePath_.back() == '/') {
        rep.filePath_ += "index.html";
    }
    rep.fileExtension_ = extensionOf(rep.filePath_);

    const size_t fileSize = fileIO_->openFile(connectionId, req, rep);
    if (rep.isSent()) {
        // error reply from fileIO_
        if (req.method_ == "HEAD") {
            rep.content_.clear();
        }
        return;
    }

    if (req.method_ == "HEAD" || fileSize == 0) {
        rep.content_.clear();
        fileIO_->closeFile(connectionId);
    } else {
        readNextPart(connectionId, rep);
        rep.replyPartial_ = !rep.finalPart_;
    }

    if (!rep.hasHeader("Content-Type")) {
        rep.addHeader("Content-Type", mime_types::extensionToType(rep.fileExtension_));
    }
    rep.addHeader("Content-Length", std::to_string(fileSize));
    rep.status_ = Reply::ok;
    rep.returnToClient_ = true;
}

void RequestHandler::readNextPart(unsigned connectionId, Reply &rep) {
    rep.content_.resize(partSize_);
    const size_t n = fileIO_->readFile(connectionId, rep.content_.data(), rep.content_.size());
    rep.content_.resize(n);
    if (n < partSize_) {
        rep.finalPart_ = true;
        fileIO_->closeFile(connectionId);
    }
}

void RequestHandler::closeFile(unsigned connectionId) {
    if (fileIO_ != nullptr) {
        fileIO_->closeFile(connectionId);
    }
}

}  // namespace ludo
