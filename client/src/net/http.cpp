#include "net/http.hpp"

#include "net/curl_transfer.hpp"
#include "net/response_stream.hpp"
#include "util/string_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <curl/curl.h>

namespace resumedl {

constexpr const char* USER_AGENT = "resumedl/1.0";

std::string http_response::header(const std::string& name) const {
    auto it = headers.find(string_utils::to_lower(name));
    if (it == headers.end()) {
        return "";
    }
    return it->second;
}

bool http_response::content_range(std::int64_t& first, std::int64_t& last,
                                  std::int64_t& total) const {
    std::string value = string_utils::trim(header("content-range"));
    if (string_utils::to_lower(value.substr(0, 6)) != "bytes ") {
        return false;
    }

    long long parsed_first = 0;
    long long parsed_last = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str() + 6, "%lld-%lld/%n", &parsed_first, &parsed_last,
                    &consumed) != 2 ||
        consumed == 0 || parsed_first < 0 || parsed_last < parsed_first) {
        return false;
    }

    const char* rest = value.c_str() + 6 + consumed;
    if (std::strcmp(rest, "*") == 0) {
        total = -1;
    } else {
        char* end = nullptr;
        long long parsed_total = std::strtoll(rest, &end, 10);
        if (end == rest || *end != '\0' || parsed_total <= parsed_last) {
            return false;
        }
        total = parsed_total;
    }
    first = parsed_first;
    last = parsed_last;
    return true;
}

http_options::http_options()
    : user_agent(USER_AGENT), follow_redirects(true), connect_timeout(30000) {}

http_client::http_client(http_options options) : m_options(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

http_client::~http_client() {
    curl_global_cleanup();
}

http_response http_client::head(const http_request& req, const context_ptr& ctx) {
    curl_transfer transfer(req, m_options, ctx, true);
    transfer.wait_for_completion();
    http_response resp = transfer.response();
    transfer.close();
    return resp;
}

std::unique_ptr<response_stream> http_client::get(const http_request& req,
                                                  const context_ptr& ctx) {
    auto transfer = std::make_unique<curl_transfer>(req, m_options, ctx, false);
    transfer->wait_for_headers();
    return std::make_unique<response_stream>(std::move(transfer));
}

} // namespace resumedl
