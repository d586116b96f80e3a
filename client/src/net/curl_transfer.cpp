#include "net/curl_transfer.hpp"

#include "core/errors.hpp"
#include "util/log.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace resumedl {

namespace {
// Upper bound for one curl_multi_poll wait; cancellation wakes it earlier.
constexpr int max_poll_wait_ms = 1000;

[[noreturn]] void throw_for_result(CURLcode code, const char* detail) {
    std::string message = (detail && detail[0] != '\0') ? detail : curl_easy_strerror(code);
    switch (code) {
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        throw validation_error(message);
    default:
        throw network_error(message);
    }
}

void validate_url(const std::string& url) {
    CURLU* handle = curl_url();
    if (!handle) {
        throw validation_error("cannot allocate URL parser");
    }
    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
    curl_url_cleanup(handle);
    if (rc != CURLUE_OK) {
        throw validation_error("invalid url \"" + url + "\": " + curl_url_strerror(rc));
    }
}

bool is_followed_redirect(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

std::int64_t parse_length(const std::string& value) {
    if (value.empty()) {
        return -1;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' || parsed < 0) {
        return -1;
    }
    return static_cast<std::int64_t>(parsed);
}
} // namespace

curl_transfer::curl_transfer(const http_request& req, const http_options& options,
                             const context_ptr& ctx, bool head_only)
    : m_ctx(ctx ? ctx : cancellation_context::create()),
      m_follow_redirects(options.follow_redirects), m_wakeup(std::make_shared<wakeup_target>()) {
    m_error_buffer[0] = '\0';
    validate_url(req.url);

    m_easy = curl_easy_init();
    if (!m_easy) {
        throw network_error("Failed to initialize curl handle");
    }
    m_multi = curl_multi_init();
    if (!m_multi) {
        curl_easy_cleanup(m_easy);
        m_easy = nullptr;
        throw network_error("Failed to initialize curl multi handle");
    }

    curl_easy_setopt(m_easy, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(m_easy, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(m_easy, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(m_easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(m_easy, CURLOPT_ERRORBUFFER, m_error_buffer);
    curl_easy_setopt(m_easy, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(m_easy, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(m_easy, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(m_easy, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(m_easy, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(m_easy, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(m_easy, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(m_easy, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(m_easy, CURLOPT_SSL_VERIFYHOST, 2L);
    // Prefer HTTP/2 over TLS if available (falls back automatically)
    curl_easy_setopt(m_easy, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (options.connect_timeout.count() > 0) {
        curl_easy_setopt(m_easy, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connect_timeout.count()));
    }
    if (head_only) {
        curl_easy_setopt(m_easy, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(m_easy, CURLOPT_HTTPGET, 1L);
    }

    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        m_header_list = curl_slist_append(m_header_list, header_string.c_str());
    }
    if (m_header_list) {
        curl_easy_setopt(m_easy, CURLOPT_HTTPHEADER, m_header_list);
    }

    curl_multi_add_handle(m_multi, m_easy);

    m_wakeup->multi = m_multi;
    std::shared_ptr<wakeup_target> target = m_wakeup;
    m_wakeup_registration = m_ctx->on_cancel([target]() {
        std::lock_guard<std::mutex> lock(target->mutex);
        if (target->multi) {
            curl_multi_wakeup(target->multi);
        }
    });

    RESUMEDL_LOG(std::cout << "[http] " << (head_only ? "HEAD " : "GET ") << req.url
                           << std::endl);
    RESUMEDL_LOG(for (const auto& header : req.headers) std::cout
                 << "[http]   " << header.first << ": " << header.second << std::endl);
}

curl_transfer::~curl_transfer() {
    close();
}

void curl_transfer::close() {
    if (!m_multi && !m_easy) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeup->mutex);
        m_wakeup->multi = nullptr;
    }
    if (m_wakeup_registration != 0) {
        m_ctx->remove_on_cancel(m_wakeup_registration);
        m_wakeup_registration = 0;
    }

    if (m_multi && m_easy) {
        curl_multi_remove_handle(m_multi, m_easy);
    }
    if (m_easy) {
        curl_easy_cleanup(m_easy);
        m_easy = nullptr;
    }
    if (m_multi) {
        curl_multi_cleanup(m_multi);
        m_multi = nullptr;
    }
    if (m_header_list) {
        curl_slist_free_all(m_header_list);
        m_header_list = nullptr;
    }
}

template <typename Predicate>
void curl_transfer::pump(Predicate ready) {
    if (!m_multi) {
        throw network_error("transfer already closed");
    }

    while (!ready() && !m_done) {
        if (m_ctx->is_cancelled()) {
            m_ctx->throw_cancelled();
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(m_multi, &running);
        if (mc != CURLM_OK) {
            throw network_error(std::string("curl_multi_perform() failed: ") +
                                curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(m_multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                m_done = true;
                m_result = msg->data.result;
            }
        }
        if (m_done || ready()) {
            break;
        }

        // Interrupted by curl_multi_wakeup() when the context is cancelled.
        mc = curl_multi_poll(m_multi, nullptr, 0, max_poll_wait_ms, nullptr);
        if (mc != CURLM_OK) {
            throw network_error(std::string("curl_multi_poll() failed: ") +
                                curl_multi_strerror(mc));
        }
    }
}

void curl_transfer::wait_for_headers() {
    pump([this] { return m_headers_complete; });
    if (m_headers_complete) {
        return;
    }
    if (m_ctx->is_cancelled()) {
        m_ctx->throw_cancelled();
    }
    if (m_result != CURLE_OK) {
        throw_for_result(m_result, m_error_buffer);
    }
    throw network_error("connection closed before response headers were received");
}

void curl_transfer::wait_for_completion() {
    pump([] { return false; });
    if (m_result != CURLE_OK) {
        if (m_ctx->is_cancelled()) {
            m_ctx->throw_cancelled();
        }
        throw_for_result(m_result, m_error_buffer);
    }
}

std::size_t curl_transfer::read_body(char* buffer, std::size_t capacity) {
    pump([this] { return buffered(); });

    if (!buffered()) {
        if (m_result != CURLE_OK) {
            if (m_ctx->is_cancelled()) {
                m_ctx->throw_cancelled();
            }
            throw_for_result(m_result, m_error_buffer);
        }
        return 0;
    }

    std::size_t n = std::min(capacity, m_pending.size() - m_pending_offset);
    std::memcpy(buffer, m_pending.data() + m_pending_offset, n);
    m_pending_offset += n;
    if (m_pending_offset == m_pending.size()) {
        m_pending.clear();
        m_pending_offset = 0;
    }
    return n;
}

bool curl_transfer::drained() const {
    return m_done && m_result == CURLE_OK && !buffered();
}

size_t curl_transfer::write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto self = static_cast<curl_transfer*>(userp);
    size_t total_size = size * nmemb;
    self->m_pending.append(contents, total_size);
    return total_size;
}

size_t curl_transfer::header_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto self = static_cast<curl_transfer*>(userp);
    size_t total_size = size * nmemb;
    self->on_header_line(std::string(contents, total_size));
    return total_size;
}

void curl_transfer::on_header_line(std::string line) {
    // Remove line terminator
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    if (line.compare(0, 5, "HTTP/") == 0) {
        // Status line: a new header block starts (redirects and 1xx produce several).
        m_block = http_response();
        m_block_has_location = false;
        size_t space = line.find(' ');
        if (space != std::string::npos) {
            m_block.status_code = std::atoi(line.c_str() + space + 1);
        }
        return;
    }

    if (line.empty()) {
        int code = m_block.status_code;
        if (code >= 200 &&
            !(m_follow_redirects && is_followed_redirect(code) && m_block_has_location)) {
            auto it = m_block.headers.find("content-length");
            if (it != m_block.headers.end()) {
                m_block.content_length = parse_length(it->second);
            }
            m_response = m_block;
            m_headers_complete = true;
            RESUMEDL_LOG(std::cout << "[http] Response status " << code << std::endl);
        }
        return;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos != std::string::npos) {
        std::string header_name =
            string_utils::to_lower(string_utils::trim(line.substr(0, colon_pos)));
        std::string header_value = string_utils::trim(line.substr(colon_pos + 1));
        if (header_name == "location") {
            m_block_has_location = true;
        }
        m_block.headers[header_name] = header_value;
    }
}

} // namespace resumedl
