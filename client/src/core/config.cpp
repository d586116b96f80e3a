#include "core/config.hpp"

#include "core/errors.hpp"

#include <fstream>

namespace resumedl {

namespace {
template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw validation_error(std::string("config key \"") + key + "\": " + e.what());
    }
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    std::int64_t value = out.count();
    read_key(j, key, value);
    if (value < 0) {
        throw validation_error(std::string("config key \"") + key + "\" must not be negative");
    }
    out = std::chrono::milliseconds(value);
}

const char* to_string(oversize_policy policy) {
    return policy == oversize_policy::fail ? "fail" : "restart";
}
} // namespace

void from_json(const nlohmann::json& j, config& cfg) {
    if (!j.is_object()) {
        throw validation_error("config must be a JSON object");
    }

    read_key(j, "resume_disabled", cfg.resume_disabled);
    read_key(j, "extra_headers", cfg.extra_headers);
    read_key(j, "accept_non_2xx", cfg.accept_non_2xx);
    read_millis(j, "inactivity_timeout_ms", cfg.inactivity_timeout);
    read_millis(j, "poll_interval_ms", cfg.poll_interval);

    std::string policy = to_string(cfg.oversize);
    read_key(j, "oversize_policy", policy);
    if (policy == "restart") {
        cfg.oversize = oversize_policy::restart;
    } else if (policy == "fail") {
        cfg.oversize = oversize_policy::fail;
    } else {
        throw validation_error("config key \"oversize_policy\": unknown value \"" + policy +
                               "\"");
    }

    read_key(j, "user_agent", cfg.http.user_agent);
    read_key(j, "follow_redirects", cfg.http.follow_redirects);
    read_millis(j, "connect_timeout_ms", cfg.http.connect_timeout);
}

void to_json(nlohmann::json& j, const config& cfg) {
    j = nlohmann::json{{"resume_disabled", cfg.resume_disabled},
                       {"extra_headers", cfg.extra_headers},
                       {"accept_non_2xx", cfg.accept_non_2xx},
                       {"inactivity_timeout_ms", cfg.inactivity_timeout.count()},
                       {"poll_interval_ms", cfg.poll_interval.count()},
                       {"oversize_policy", to_string(cfg.oversize)},
                       {"user_agent", cfg.http.user_agent},
                       {"follow_redirects", cfg.http.follow_redirects},
                       {"connect_timeout_ms", cfg.http.connect_timeout.count()}};
}

config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw filesystem_error("cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw validation_error("parsing " + path + ": " + e.what());
    }

    config cfg;
    from_json(j, cfg);
    return cfg;
}

} // namespace resumedl
