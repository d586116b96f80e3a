#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

#include "core/resume_planner.hpp"

namespace resumedl {

// Target file of a download. Closed exactly once, by close() or the destructor.
class output_file {
public:
    // Throws filesystem_error when the file cannot be opened.
    output_file(const std::string& path, open_mode mode);
    ~output_file();

    output_file(const output_file&) = delete;
    output_file& operator=(const output_file&) = delete;

    // Throws filesystem_error on a failed write.
    void write(const char* data, std::size_t length);

    // Flushes and closes. Throws filesystem_error when buffered data cannot be written.
    void close();

    bool is_open() const {
        return m_stream.is_open();
    }

    const std::string& path() const {
        return m_path;
    }

    // Length of the file at `path`, or 0 when it does not exist.
    static std::int64_t existing_size(const std::string& path);

private:
    std::string m_path;
    std::ofstream m_stream;
};

} // namespace resumedl
