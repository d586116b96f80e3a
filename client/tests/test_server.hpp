#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Deterministic text payload of `size` bytes.
std::string make_payload(std::size_t size);

// Writes `contents` to `path`, replacing it.
void write_file(const std::string& path, const std::string& contents);
std::string read_file(const std::string& path);

// Unique path under the system temp directory, removed on destruction.
class temp_path {
public:
    temp_path();
    ~temp_path();

    temp_path(const temp_path&) = delete;
    temp_path& operator=(const temp_path&) = delete;

    const std::string& str() const {
        return m_path;
    }

private:
    std::string m_path;
};

// Minimal HTTP/1.1 server on 127.0.0.1 serving a single in-memory resource.
// One request per connection; every response carries "Connection: close".
class test_server {
public:
    struct options {
        std::string payload;
        bool accept_ranges = true;
        bool send_content_length = true;
        // When false, Range headers are ignored and 200 is returned.
        bool honor_range = true;
        // Status sent for GET instead of 200/206 (body is still the payload). 0 = off.
        int get_status = 0;
        // Sent as the Content-Range of GET responses when non-empty.
        std::string content_range;
        std::size_t chunk_size = 1024;
        std::chrono::milliseconds chunk_delay{0};
        // Stop sending after this many body bytes and hold the connection open.
        std::size_t stall_after = static_cast<std::size_t>(-1);
    };

    struct recorded_request {
        std::string method;
        std::string target;
        // Lower-cased header names.
        std::map<std::string, std::string> headers;
    };

    explicit test_server(options opts);
    ~test_server();

    test_server(const test_server&) = delete;
    test_server& operator=(const test_server&) = delete;

    std::string url(const std::string& path = "/test.txt") const;

    std::vector<recorded_request> requests() const;
    std::size_t count(const std::string& method) const;

private:
    void accept_loop();
    void handle_connection(int client_fd);
    bool read_request(int client_fd, recorded_request& req);
    bool send_all(int client_fd, const char* data, std::size_t length);
    // Sleeps for `duration`; returns false when the server is shutting down.
    bool pause_for(std::chrono::milliseconds duration);
    void hold_open(int client_fd);

    options m_options;
    int m_listen_fd = -1;
    int m_port = 0;

    std::atomic<bool> m_stopping{false};
    std::mutex m_stop_mutex;
    std::condition_variable m_stop_cv;

    std::thread m_accept_thread;
    std::mutex m_threads_mutex;
    std::vector<std::thread> m_connection_threads;

    mutable std::mutex m_requests_mutex;
    std::vector<recorded_request> m_requests;
};
