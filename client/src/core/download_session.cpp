#include "core/download_session.hpp"

#include "core/errors.hpp"
#include "core/head_probe.hpp"
#include "core/resume_planner.hpp"
#include "core/stream_copier.hpp"
#include "util/byte_utils.hpp"
#include "util/defer.hpp"
#include "util/log.hpp"

#include <mutex>
#include <utility>

namespace resumedl {

download_session::download_session(const std::string& url, const std::string& path)
    : m_url(url), m_path(path), m_completed(0) {}

download_session::~download_session() {
    finish();
}

void download_session::run() {
    if (!m_finished && !m_already_complete) {
        m_finished = true;
        DEFER(finish(););
        try {
            // Bodies of accepted non-2xx responses are not the resource and are not bounded by it.
            std::int64_t limit =
                (m_status_code == 200 || m_status_code == 206) ? m_size : unknown_size;
            stream_copier(*m_stream, *m_file, m_completed, *m_watchdog, limit).run();
            RESUMEDL_LOG(std::cout << "[download_session] Finished " << m_path << ": "
                                   << byte_utils::format_progress(completed(), m_size)
                                   << std::endl);
        } catch (const download_error& e) {
            RESUMEDL_LOG(std::cerr << "[download_session] Transfer of " << m_url
                                   << " failed: " << e.what() << std::endl);
            record_error(std::current_exception());
        }
    }

    if (std::exception_ptr e = error()) {
        std::rethrow_exception(e);
    }
}

std::exception_ptr download_session::error() const {
    std::lock_guard<std::mutex> lock(m_error_mutex);
    return m_error;
}

void download_session::record_error(std::exception_ptr e) {
    std::lock_guard<std::mutex> lock(m_error_mutex);
    if (!m_error) {
        m_error = std::move(e);
    }
}

void download_session::run_and_poll(const poll_callback_t& callback,
                                    std::chrono::milliseconds interval) {
    if (m_already_complete) {
        if (callback) {
            callback(completed(), m_size);
        }
        return;
    }

    run_with_progress(callback, interval, m_completed, m_size, [this] { run(); });
}

void download_session::finish() noexcept {
    if (m_stream) {
        m_stream->close();
    }
    if (m_file) {
        try {
            m_file->close();
        } catch (const filesystem_error&) {
            record_error(std::current_exception());
        }
    }
    if (m_watchdog) {
        m_watchdog->cancel();
    }
}

std::unique_ptr<download_session> open_session(const context_ptr& ctx, const std::string& path,
                                               const std::string& url, const config& cfg) {
    auto client = std::make_unique<http_client>(cfg.http);
    // Armed for the whole operation, HEAD included.
    auto dog = std::make_unique<watchdog>(ctx, cfg.inactivity_timeout);
    const context_ptr& op_ctx = dog->context();

    std::int64_t local_size = output_file::existing_size(path);
    head_result head = probe_head(*client, url, cfg.extra_headers, op_ctx, cfg.accept);

    resume_inputs inputs;
    inputs.local_size = local_size;
    inputs.remote_size = head.remote_size;
    inputs.resume_allowed = !cfg.resume_disabled;
    inputs.server_can_resume = head.can_resume;
    inputs.oversize = cfg.oversize;
    transfer_plan plan = plan_transfer(inputs);

    std::unique_ptr<download_session> session(new download_session(url, path));
    session->m_size = head.remote_size;
    session->m_head_response = head.response;

    if (plan.already_complete) {
        RESUMEDL_LOG(std::cout << "[download_session] " << path << " already complete ("
                               << byte_utils::format_bytes(plan.start_offset) << ")"
                               << std::endl);
        if (plan.start_offset == 0) {
            // An empty resource still leaves an (empty) file behind.
            output_file(path, open_mode::append).close();
        }
        dog->cancel();
        session->m_start_offset = plan.start_offset;
        session->m_completed.store(plan.start_offset, std::memory_order_release);
        session->m_already_complete = true;
        session->m_client = std::move(client);
        return session;
    }

    http_request req(url);
    req.headers = cfg.extra_headers;
    if (plan.send_range) {
        req.headers["Range"] = "bytes=" + std::to_string(plan.start_offset) + "-";
        RESUMEDL_LOG(std::cout << "[download_session] Resuming " << path << " at "
                               << byte_utils::format_bytes(plan.start_offset) << std::endl);
    }

    std::unique_ptr<response_stream> stream = client->get(req, op_ctx);
    int status = stream->response().status_code;
    if (!cfg.accept_non_2xx && status != 200 && status != 206) {
        throw server_status_error(status);
    }

    if (status == 206) {
        // The body must start where the file ends and describe the same resource.
        std::int64_t first = 0;
        std::int64_t last = 0;
        std::int64_t total = unknown_size;
        if (!stream->response().content_range(first, last, total) ||
            first != plan.start_offset ||
            (session->m_size != unknown_size && total != unknown_size &&
             total != session->m_size)) {
            throw network_error("partial response does not match the requested range "
                                "(Content-Range: \"" +
                                stream->response().header("content-range") + "\")");
        }
        if (session->m_size == unknown_size) {
            session->m_size = total;
        }
    }
    if (plan.send_range && status != 206) {
        // Range was ignored: the body starts at offset 0.
        RESUMEDL_LOG(std::cout << "[download_session] Server ignored Range (status " << status
                               << "), restarting from offset 0" << std::endl);
        plan.start_offset = 0;
        plan.mode = open_mode::truncate;
    }
    if (session->m_size == unknown_size && status == 200 &&
        stream->response().content_length >= 0) {
        session->m_size = stream->response().content_length;
    }

    auto file = std::make_unique<output_file>(path, plan.mode);

    session->m_start_offset = plan.start_offset;
    session->m_completed.store(plan.start_offset, std::memory_order_release);
    session->m_status_code = status;
    session->m_client = std::move(client);
    session->m_watchdog = std::move(dog);
    session->m_stream = std::move(stream);
    session->m_file = std::move(file);
    return session;
}

} // namespace resumedl
