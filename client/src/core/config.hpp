#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "core/progress_reporter.hpp"
#include "core/resume_planner.hpp"
#include "net/http.hpp"

namespace resumedl {

// Inspects the HEAD response before any byte is transferred. Return false (optionally
// filling `reason`) to veto the download.
using accept_predicate_t = std::function<bool(const http_response& head, std::string& reason)>;

struct config {
    // Ignore any local partial file and always start from offset 0.
    bool resume_disabled = false;
    // Merged into both the HEAD and the GET request.
    std::map<std::string, std::string> extra_headers;
    accept_predicate_t accept;
    // Do not fail on a GET status other than 200/206.
    bool accept_non_2xx = false;
    // Abort when no data arrives for this long. Zero disables the watchdog.
    std::chrono::milliseconds inactivity_timeout{0};
    std::chrono::milliseconds poll_interval{1000};
    poll_callback_t poll_callback;
    oversize_policy oversize = oversize_policy::restart;
    http_options http;
};

// Reads the serializable part of a config. Unknown keys are ignored; callbacks keep
// their current values. Throws validation_error on malformed values.
void from_json(const nlohmann::json& j, config& cfg);
void to_json(nlohmann::json& j, const config& cfg);

config load_config(const std::string& path);

} // namespace resumedl
