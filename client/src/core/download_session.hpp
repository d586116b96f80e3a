#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/output_file.hpp"
#include "core/progress_reporter.hpp"
#include "core/watchdog.hpp"
#include "net/http.hpp"
#include "net/response_stream.hpp"

namespace resumedl {

// One transfer of `url` into `path`. Created by open_session() after the HEAD probe
// and the resume decision; owns the response stream, the output file and the
// watchdog until run() returns.
class download_session {
public:
    ~download_session();

    download_session(const download_session&) = delete;
    download_session& operator=(const download_session&) = delete;

    // Copies the response body into the file. Rethrows the terminal error, if any.
    // Later calls only rethrow the outcome of the first.
    void run();

    // run() while reporting progress: once before the copy starts, once per interval
    // and once after it ends. When the file was already complete the callback is
    // invoked exactly once.
    void run_and_poll(const poll_callback_t& callback, std::chrono::milliseconds interval);

    std::int64_t completed() const {
        return m_completed.load(std::memory_order_acquire);
    }

    // Total size of the resource, or unknown_size.
    std::int64_t size() const {
        return m_size;
    }

    std::int64_t start_offset() const {
        return m_start_offset;
    }

    bool already_complete() const {
        return m_already_complete;
    }

    const std::string& url() const {
        return m_url;
    }

    const std::string& path() const {
        return m_path;
    }

    const http_response& head_response() const {
        return m_head_response;
    }

    // Status of the GET response; 0 when no GET was needed.
    int status_code() const {
        return m_status_code;
    }

    // Terminal error of run(), or null. Safe to poll while run() is in progress.
    std::exception_ptr error() const;

private:
    friend std::unique_ptr<download_session> open_session(const context_ptr& ctx,
                                                          const std::string& path,
                                                          const std::string& url,
                                                          const config& cfg);

    download_session(const std::string& url, const std::string& path);

    void finish() noexcept;
    // Keeps the first error only.
    void record_error(std::exception_ptr e);

    std::string m_url;
    std::string m_path;
    std::int64_t m_size = unknown_size;
    std::int64_t m_start_offset = 0;
    bool m_already_complete = false;
    int m_status_code = 0;
    http_response m_head_response;

    std::atomic<std::int64_t> m_completed;
    mutable std::mutex m_error_mutex;
    std::exception_ptr m_error;
    bool m_finished = false;

    // Declaration order is teardown order in reverse: the file and the stream go
    // first, the client (and libcurl) last.
    std::unique_ptr<http_client> m_client;
    std::unique_ptr<watchdog> m_watchdog;
    std::unique_ptr<response_stream> m_stream;
    std::unique_ptr<output_file> m_file;
};

// Probes `url`, decides how to resume and, unless the local file is already complete,
// sends the GET request and opens `path` for writing. `ctx` may be null.
// Throws a download_error subclass on failure.
std::unique_ptr<download_session> open_session(const context_ptr& ctx, const std::string& path,
                                               const std::string& url, const config& cfg);

} // namespace resumedl
