#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "core/cancellation.hpp"

namespace resumedl {

// Inactivity timer. Owns a child of the caller's context and cancels it with
// cancel_cause::deadline_exceeded when no kick() arrives within the timeout.
//
//   disabled  (timeout == 0, no timer thread)
//   armed  -> fired            deadline elapsed
//   armed  -> cancelled_clean  cancel() called
//
// Terminal states are final; a fire racing cancel() resolves to whichever
// reaches the context first.
class watchdog {
public:
    enum class state {
        disabled,
        armed,
        fired,
        cancelled_clean,
    };

    watchdog(const context_ptr& parent, std::chrono::milliseconds timeout);
    ~watchdog();

    watchdog(const watchdog&) = delete;
    watchdog& operator=(const watchdog&) = delete;

    // Context merging the parent's cancellation with the inactivity deadline.
    const context_ptr& context() const {
        return m_context;
    }

    void kick();
    void cancel();

    state current_state() const;

private:
    void timer_loop();

    context_ptr m_context;
    std::chrono::milliseconds m_timeout;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    state m_state;
    std::chrono::steady_clock::time_point m_deadline;
    std::thread m_timer;
};

} // namespace resumedl
