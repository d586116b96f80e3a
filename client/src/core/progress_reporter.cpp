#include "core/progress_reporter.hpp"

#include "util/defer.hpp"

#include <utility>

namespace resumedl {

progress_reporter::progress_reporter(poll_callback_t callback, std::chrono::milliseconds interval,
                                     const std::atomic<std::int64_t>& counter, std::int64_t total)
    : m_callback(std::move(callback)), m_interval(interval), m_counter(counter), m_total(total) {}

progress_reporter::~progress_reporter() {
    if (m_ticker.joinable()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopped = true;
        }
        m_cv.notify_all();
        m_ticker.join();
    }
}

void progress_reporter::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running || m_stopped) {
            return;
        }
        m_running = true;
    }

    if (!m_callback) {
        return;
    }

    report();
    if (m_interval.count() > 0) {
        m_ticker = std::thread(&progress_reporter::tick_loop, this);
    }
}

void progress_reporter::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running || m_stopped) {
            return;
        }
        m_stopped = true;
    }
    m_cv.notify_all();

    if (m_ticker.joinable()) {
        m_ticker.join();
    }
    if (m_callback) {
        report();
    }
}

void progress_reporter::tick_loop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto next = std::chrono::steady_clock::now() + m_interval;
    while (!m_stopped) {
        if (m_cv.wait_until(lock, next, [this] { return m_stopped; })) {
            break;
        }
        // Missed ticks are dropped, the next tick reads the latest value.
        next = std::chrono::steady_clock::now() + m_interval;
        lock.unlock();
        report();
        lock.lock();
    }
}

void progress_reporter::report() {
    m_callback(m_counter.load(std::memory_order_acquire), m_total);
}

void run_with_progress(const poll_callback_t& callback, std::chrono::milliseconds interval,
                       const std::atomic<std::int64_t>& counter, std::int64_t total,
                       const std::function<void()>& work) {
    progress_reporter reporter(callback, interval, counter, total);
    reporter.start();
    DEFER(reporter.stop(););
    work();
}

} // namespace resumedl
