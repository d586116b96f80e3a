#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "core/cancellation.hpp"
#include "net/http.hpp"

namespace resumedl {

// A single libcurl easy transfer driven through its own multi handle so that the
// blocking wait (curl_multi_poll) can be interrupted by the cancellation context.
class curl_transfer {
public:
    curl_transfer(const http_request& req, const http_options& options, const context_ptr& ctx,
                  bool head_only);
    ~curl_transfer();

    curl_transfer(const curl_transfer&) = delete;
    curl_transfer& operator=(const curl_transfer&) = delete;

    // Blocks until the headers of the final response (after redirects) are received.
    void wait_for_headers();

    // Blocks until the transfer has finished.
    void wait_for_completion();

    // Blocks until some body bytes are buffered or the transfer ends, then copies out
    // up to `capacity` bytes.
    std::size_t read_body(char* buffer, std::size_t capacity);

    // True once the transfer is done and every buffered byte was read.
    bool drained() const;

    const http_response& response() const {
        return m_response;
    }

    // Detaches from the context and releases the curl handles. Idempotent.
    void close();

private:
    struct wakeup_target {
        std::mutex mutex;
        CURLM* multi = nullptr;
    };

    template <typename Predicate>
    void pump(Predicate ready);

    bool buffered() const {
        return m_pending_offset < m_pending.size();
    }

    static size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* contents, size_t size, size_t nmemb, void* userp);
    void on_header_line(std::string line);

    context_ptr m_ctx;
    CURL* m_easy = nullptr;
    CURLM* m_multi = nullptr;
    struct curl_slist* m_header_list = nullptr;
    bool m_follow_redirects;

    std::shared_ptr<wakeup_target> m_wakeup;
    cancellation_context::callback_id m_wakeup_registration = 0;

    bool m_done = false;
    CURLcode m_result = CURLE_OK;
    char m_error_buffer[CURL_ERROR_SIZE];

    // Header block currently being received.
    http_response m_block;
    bool m_block_has_location = false;
    bool m_headers_complete = false;
    http_response m_response;

    std::string m_pending;
    std::size_t m_pending_offset = 0;
};

} // namespace resumedl
