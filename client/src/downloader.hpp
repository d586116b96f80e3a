#pragma once

#include <string>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/download_session.hpp"
#include "core/errors.hpp"

namespace resumedl {

// Downloads `url` into `file` with a default-constructed config. A shorter local file
// is resumed, an equally sized one is left untouched, a larger one is replaced.
// Blocks until done; throws a download_error subclass on failure.
void download(const std::string& file, const std::string& url);

// Full entry point. Cancelling `ctx` (may be null) aborts the transfer with
// cancelled_error; bytes already written stay on disk so a later call can resume.
void download_with_config(const context_ptr& ctx, const std::string& file,
                          const std::string& url, const config& cfg);

} // namespace resumedl
