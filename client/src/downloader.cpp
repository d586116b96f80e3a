#include "downloader.hpp"

namespace resumedl {

void download(const std::string& file, const std::string& url) {
    download_with_config(nullptr, file, url, config());
}

void download_with_config(const context_ptr& ctx, const std::string& file,
                          const std::string& url, const config& cfg) {
    std::unique_ptr<download_session> session = open_session(ctx, file, url, cfg);
    session->run_and_poll(cfg.poll_callback, cfg.poll_interval);
}

} // namespace resumedl
