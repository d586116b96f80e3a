#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "net/http.hpp"

namespace resumedl {

struct head_result {
    // unknown_size when the server omits Content-Length.
    std::int64_t remote_size;
    // Accept-Ranges: bytes was advertised and the size is known.
    bool can_resume;
    http_response response;
};

// Issues the metadata request that precedes every transfer and applies the accept
// predicate to it. Throws rejected_error on veto.
head_result probe_head(http_client& client, const std::string& url,
                       const std::map<std::string, std::string>& extra_headers,
                       const context_ptr& ctx, const accept_predicate_t& accept);

bool server_supports_ranges(const http_response& head);

} // namespace resumedl
