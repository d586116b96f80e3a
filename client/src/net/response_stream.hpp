#pragma once

#include <memory>

#include "core/byte_source.hpp"
#include "net/curl_transfer.hpp"
#include "net/http.hpp"

namespace resumedl {

// Body of a GET response. Reads block inside the transfer and fail as soon as the
// request's context is cancelled.
class response_stream : public byte_source {
public:
    explicit response_stream(std::unique_ptr<curl_transfer> transfer);
    ~response_stream() override;

    response_stream(const response_stream&) = delete;
    response_stream& operator=(const response_stream&) = delete;

    std::size_t read(char* buffer, std::size_t capacity) override;
    bool at_end() const override;
    void close() override;

    const http_response& response() const {
        return m_transfer->response();
    }

private:
    std::unique_ptr<curl_transfer> m_transfer;
    bool m_closed = false;
};

} // namespace resumedl
