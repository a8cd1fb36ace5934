#include "ludo/parse_common.hpp"
#include "ludo/request_decoder.hpp"

namespace ludo {

bool RequestDecoder::decodeRequest(Request &req) {
    req.requestPath_ = urlDecode(req.uri_.substr(0, req.uri_.find('?')));

    return !req.requestPath_.empty() && req.requestPath_[0] == '/' &&
           req.requestPath_.find("..") == std::string::npos;
}

// '+' stays as is, it only means space in query strings.
std::string RequestDecoder::urlDecode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

}  // namespace ludo
