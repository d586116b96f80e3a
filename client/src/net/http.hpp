#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "core/cancellation.hpp"

namespace resumedl {

class response_stream;

struct http_response {
    int status_code;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    // -1 when the server sent no Content-Length.
    std::int64_t content_length;

    http_response() : status_code(0), content_length(-1) {}

    // Value of header `name` (case-insensitive), or "" when absent.
    std::string header(const std::string& name) const;

    // Parses `Content-Range: bytes <first>-<last>/<total>`. `total` is -1 for "*".
    // Returns false when the header is absent or malformed.
    bool content_range(std::int64_t& first, std::int64_t& last, std::int64_t& total) const;
};

struct http_request {
    std::string url;
    std::map<std::string, std::string> headers;

    http_request(const std::string& url) : url(url) {}
};

struct http_options {
    std::string user_agent;
    bool follow_redirects;
    // 0 keeps the libcurl default.
    std::chrono::milliseconds connect_timeout;

    http_options();
};

// HEAD/GET over libcurl. Every call runs under a cancellation context; cancelling the
// context wakes the blocking call, which then throws timeout_error or cancelled_error.
class http_client {
public:
    explicit http_client(http_options options = http_options());
    ~http_client();

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Performs a HEAD request; the (empty) body is drained before returning.
    http_response head(const http_request& req, const context_ptr& ctx);

    // Sends a GET request and returns once the final response headers have arrived.
    // The body is then pulled from the returned stream.
    std::unique_ptr<response_stream> get(const http_request& req, const context_ptr& ctx);

    const http_options& options() const {
        return m_options;
    }

private:
    http_options m_options;
};

} // namespace resumedl
