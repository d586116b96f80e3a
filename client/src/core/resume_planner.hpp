#pragma once

#include <cstdint>

namespace resumedl {

constexpr std::int64_t unknown_size = -1;

// What to do with a local file that is larger than the remote resource.
enum class oversize_policy {
    restart,
    fail,
};

enum class open_mode {
    append,
    truncate,
};

struct transfer_plan {
    std::int64_t start_offset = 0;
    open_mode mode = open_mode::truncate;
    bool send_range = false;
    // Local file already matches the remote size; no GET is needed.
    bool already_complete = false;
};

struct resume_inputs {
    std::int64_t local_size = 0;
    std::int64_t remote_size = unknown_size;
    bool resume_allowed = true;
    bool server_can_resume = false;
    oversize_policy oversize = oversize_policy::restart;
};

// Maps the local/remote state to a transfer plan. Performs no I/O.
// Throws filesystem_error when the local file is oversized and the policy is fail.
transfer_plan plan_transfer(const resume_inputs& in);

} // namespace resumedl
