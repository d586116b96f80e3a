#include "net/response_stream.hpp"

#include <utility>

namespace resumedl {

response_stream::response_stream(std::unique_ptr<curl_transfer> transfer)
    : m_transfer(std::move(transfer)) {}

response_stream::~response_stream() {
    close();
}

std::size_t response_stream::read(char* buffer, std::size_t capacity) {
    if (m_closed) {
        return 0;
    }
    return m_transfer->read_body(buffer, capacity);
}

bool response_stream::at_end() const {
    return m_closed || m_transfer->drained();
}

void response_stream::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_transfer->close();
}

} // namespace resumedl
