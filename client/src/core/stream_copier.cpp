#include "core/stream_copier.hpp"

#include "core/errors.hpp"
#include "util/log.hpp"

#include <string>
#include <vector>

namespace resumedl {

stream_copier::stream_copier(byte_source& source, output_file& target,
                             std::atomic<std::int64_t>& completed, watchdog& dog,
                             std::int64_t limit)
    : m_source(source), m_target(target), m_completed(completed), m_watchdog(dog),
      m_limit(limit) {}

void stream_copier::run() {
    std::vector<char> buffer(chunk_size);

    while (!m_source.at_end()) {
        std::size_t n = m_source.read(buffer.data(), buffer.size());
        if (n == 0) {
            continue;
        }
        std::int64_t done = m_completed.load(std::memory_order_acquire);
        if (m_limit != unknown_size && done + static_cast<std::int64_t>(n) > m_limit) {
            RESUMEDL_LOG(std::cerr << "[stream_copier] Body overruns " << m_limit << " bytes at "
                                   << done << std::endl);
            throw network_error("response body exceeds the resource size of " +
                                std::to_string(m_limit) + " bytes");
        }
        m_target.write(buffer.data(), n);
        m_completed.fetch_add(static_cast<std::int64_t>(n), std::memory_order_acq_rel);
        m_watchdog.kick();
    }
}

} // namespace resumedl
