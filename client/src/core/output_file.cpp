#include "core/output_file.hpp"

#include "core/errors.hpp"
#include "util/log.hpp"

#include <sys/stat.h>

namespace resumedl {

output_file::output_file(const std::string& path, open_mode mode) : m_path(path) {
    std::ios::openmode flags = std::ios::binary | std::ios::out;
    flags |= (mode == open_mode::append) ? std::ios::app : std::ios::trunc;

    m_stream.open(path, flags);
    if (!m_stream.is_open()) {
        throw filesystem_error("cannot open " + path + " for writing");
    }
    RESUMEDL_LOG(std::cout << "[output_file] Opened " << path
                           << (mode == open_mode::append ? " (append)" : " (truncate)")
                           << std::endl);
}

output_file::~output_file() {
    if (m_stream.is_open()) {
        m_stream.close();
        if (m_stream.fail()) {
            RESUMEDL_LOG(std::cerr << "[output_file] Failed to flush " << m_path << std::endl);
        }
    }
}

void output_file::write(const char* data, std::size_t length) {
    m_stream.write(data, static_cast<std::streamsize>(length));
    if (!m_stream) {
        throw filesystem_error("write to " + m_path + " failed");
    }
}

void output_file::close() {
    if (!m_stream.is_open()) {
        return;
    }
    m_stream.close();
    if (m_stream.fail()) {
        throw filesystem_error("flushing " + m_path + " on close failed");
    }
}

std::int64_t output_file::existing_size(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return 0;
    }
    return static_cast<std::int64_t>(st.st_size);
}

} // namespace resumedl
