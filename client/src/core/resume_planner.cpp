#include "core/resume_planner.hpp"

#include "core/errors.hpp"

#include <string>

namespace resumedl {

namespace {
transfer_plan fresh_plan() {
    return transfer_plan{};
}
} // namespace

transfer_plan plan_transfer(const resume_inputs& in) {
    if (!in.resume_allowed) {
        return fresh_plan();
    }

    const bool remote_known = in.remote_size != unknown_size;

    if (remote_known && in.local_size == in.remote_size) {
        transfer_plan plan;
        plan.start_offset = in.remote_size;
        plan.mode = open_mode::append;
        plan.already_complete = true;
        return plan;
    }

    if (remote_known && in.local_size > in.remote_size) {
        if (in.oversize == oversize_policy::fail) {
            throw filesystem_error("local file is larger than the remote resource (" +
                                   std::to_string(in.local_size) + " > " +
                                   std::to_string(in.remote_size) + " bytes)");
        }
        return fresh_plan();
    }

    // local < remote, or remote size unknown
    if (in.server_can_resume && in.local_size > 0) {
        transfer_plan plan;
        plan.start_offset = in.local_size;
        plan.mode = open_mode::append;
        plan.send_range = true;
        return plan;
    }
    return fresh_plan();
}

} // namespace resumedl
