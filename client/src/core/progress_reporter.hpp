#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace resumedl {

using poll_callback_t = std::function<void(std::int64_t current, std::int64_t total)>;

// Samples a progress counter on its own thread and forwards snapshots to a callback.
//
// start() reports the initial value on the calling thread, then one call per interval
// from the ticker thread. stop() joins the ticker and reports the final value on the
// calling thread. Calls never overlap and the reported values never decrease.
class progress_reporter {
public:
    progress_reporter(poll_callback_t callback, std::chrono::milliseconds interval,
                      const std::atomic<std::int64_t>& counter, std::int64_t total);
    ~progress_reporter();

    progress_reporter(const progress_reporter&) = delete;
    progress_reporter& operator=(const progress_reporter&) = delete;

    void start();
    void stop();

private:
    void tick_loop();
    void report();

    poll_callback_t m_callback;
    std::chrono::milliseconds m_interval;
    const std::atomic<std::int64_t>& m_counter;
    std::int64_t m_total;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_running = false;
    bool m_stopped = false;
    std::thread m_ticker;
};

// Runs `work` between start() and stop(). The final report is made whichever way
// `work` exits; its exception, if any, propagates afterwards.
void run_with_progress(const poll_callback_t& callback, std::chrono::milliseconds interval,
                       const std::atomic<std::int64_t>& counter, std::int64_t total,
                       const std::function<void()>& work);

} // namespace resumedl
