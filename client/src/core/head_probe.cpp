#include "core/head_probe.hpp"

#include "core/errors.hpp"
#include "core/resume_planner.hpp"
#include "util/byte_utils.hpp"
#include "util/log.hpp"
#include "util/string_utils.hpp"

namespace resumedl {

bool server_supports_ranges(const http_response& head) {
    return string_utils::to_lower(string_utils::trim(head.header("accept-ranges"))) == "bytes";
}

head_result probe_head(http_client& client, const std::string& url,
                       const std::map<std::string, std::string>& extra_headers,
                       const context_ptr& ctx, const accept_predicate_t& accept) {
    http_request req(url);
    req.headers = extra_headers;

    head_result result;
    result.response = client.head(req, ctx);
    result.remote_size =
        result.response.content_length >= 0 ? result.response.content_length : unknown_size;
    result.can_resume =
        server_supports_ranges(result.response) && result.remote_size != unknown_size;

    RESUMEDL_LOG(std::cout << "[head_probe] status=" << result.response.status_code << ", size="
                           << (result.remote_size == unknown_size
                                   ? std::string("unknown")
                                   : byte_utils::format_bytes(result.remote_size))
                           << ", ranges_supported=" << (result.can_resume ? "true" : "false")
                           << std::endl);

    if (accept) {
        std::string reason;
        if (!accept(result.response, reason)) {
            RESUMEDL_LOG(std::cerr << "[head_probe] Download rejected: " << reason << std::endl);
            throw rejected_error(reason.empty() ? "download rejected by accept predicate" : reason);
        }
    }
    return result;
}

} // namespace resumedl
