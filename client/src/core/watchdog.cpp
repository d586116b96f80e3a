#include "core/watchdog.hpp"

#include "util/log.hpp"

namespace resumedl {

watchdog::watchdog(const context_ptr& parent, std::chrono::milliseconds timeout)
    : m_context(cancellation_context::with_parent(parent)), m_timeout(timeout),
      m_state(timeout.count() > 0 ? state::armed : state::disabled) {
    if (m_state == state::armed) {
        m_deadline = std::chrono::steady_clock::now() + m_timeout;
        m_timer = std::thread(&watchdog::timer_loop, this);
    }
}

watchdog::~watchdog() {
    cancel();
}

void watchdog::kick() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // The timer thread re-reads the deadline when it wakes, no notify needed.
    if (m_state == state::armed) {
        m_deadline = std::chrono::steady_clock::now() + m_timeout;
    }
}

void watchdog::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == state::armed) {
            m_state = state::cancelled_clean;
        }
    }
    m_cv.notify_all();

    if (m_timer.joinable() && m_timer.get_id() != std::this_thread::get_id()) {
        m_timer.join();
    }

    m_context->cancel(cancel_cause::none);
}

watchdog::state watchdog::current_state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void watchdog::timer_loop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_state == state::armed) {
        if (std::chrono::steady_clock::now() >= m_deadline) {
            m_state = state::fired;
            lock.unlock();
            RESUMEDL_LOG(std::cerr << "[watchdog] No data received for " << m_timeout.count()
                                   << " ms, cancelling transfer" << std::endl);
            m_context->cancel(cancel_cause::deadline_exceeded);
            return;
        }
        m_cv.wait_until(lock, m_deadline);
    }
}

} // namespace resumedl
