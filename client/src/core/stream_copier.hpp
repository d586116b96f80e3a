#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "core/byte_source.hpp"
#include "core/output_file.hpp"
#include "core/resume_planner.hpp"
#include "core/watchdog.hpp"

namespace resumedl {

class stream_copier {
public:
    static constexpr std::size_t chunk_size = 32 * 1024;

    // `limit` is the total size of the resource; the counter never goes past it.
    stream_copier(byte_source& source, output_file& target, std::atomic<std::int64_t>& completed,
                  watchdog& dog, std::int64_t limit = unknown_size);

    // Copies until end of stream. The first read or write failure is rethrown as is;
    // nothing is retried. Cancellation surfaces as a failing read. A chunk that would
    // take the counter past the limit is not written and fails with network_error.
    void run();

private:
    byte_source& m_source;
    output_file& m_target;
    std::atomic<std::int64_t>& m_completed;
    watchdog& m_watchdog;
    std::int64_t m_limit;
};

} // namespace resumedl
