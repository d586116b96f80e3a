#pragma once

#include <cstddef>

namespace resumedl {

// Pull-based byte stream. Implementations observe their own cancellation context and
// throw a download_error from read() when cancelled or on transport failure.
class byte_source {
public:
    virtual ~byte_source() = default;

    // Reads up to `capacity` bytes into `buffer` and returns the count. A zero return
    // does not imply end of stream; check at_end().
    virtual std::size_t read(char* buffer, std::size_t capacity) = 0;

    virtual bool at_end() const = 0;

    virtual void close() = 0;
};

} // namespace resumedl
