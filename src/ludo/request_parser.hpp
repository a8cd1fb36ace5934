#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace ludo {

struct Request;

// Byte-at-a-time parser for HTTP/1.x requests. Input may be split anywhere,
// state is kept between calls to parse() until reset().
//
// Bodies are framed by Content-Length or chunked transfer coding. A request
// that has neither carries no body. Up to maxBodySize body bytes are kept in
// Request::body_; a longer body is still consumed so the connection stays in
// sync, but none of it is kept.
class RequestParser {
   public:
    explicit RequestParser(size_t maxBodySize = std::numeric_limits<size_t>::max());

    void reset();

    enum result_type { good_complete, bad, version_not_supported, indeterminate };

    // good_complete once the request including its body has been read,
    // indeterminate while more data is needed.
    result_type parse(Request &req, const std::vector<char> &data);

   private:
    result_type consume(Request &req, char input);
    result_type consumeChunked(Request &req, char input);

    // A header line has been read.
    void onHeader(Request &req);

    // Blank line after the headers, decide how the body is framed.
    result_type startBody(Request &req);

    void storeBody(Request &req, char input);

    enum state {
        method_start,
        method,
        uri_start,
        uri,
        version_prefix,
        version_major_start,
        version_major,
        version_minor_start,
        version_minor,
        request_line_lf,
        header_line_start,
        header_lws,
        header_name,
        header_value_start,
        header_value,
        header_line_lf,
        headers_end_lf,
        content,
        chunk_size_start,
        chunk_size,
        chunk_ext,
        chunk_size_lf,
        chunk_data,
        chunk_data_cr,
        chunk_data_lf,
        trailer_line_start,
        trailer_line,
        trailer_line_lf,
        trailer_end_lf,
    } state_ = method_start;

    const size_t maxBodySize_;

    // Characters of "HTTP/" matched so far.
    size_t prefixMatched_ = 0;

    // Body bytes left of the Content-Length or of the current chunk.
    size_t remaining_ = 0;

    // Unparsable Content-Length or an unsupported Transfer-Encoding.
    bool badFraming_ = false;

    bool bodyDropped_ = false;
};

}  // namespace ludo
