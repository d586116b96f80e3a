#include "core/errors.hpp"

namespace resumedl {

const char* to_string(error_kind kind) {
    switch (kind) {
    case error_kind::validation:
        return "validation";
    case error_kind::network:
        return "network";
    case error_kind::rejected:
        return "rejected";
    case error_kind::server_status:
        return "server_status";
    case error_kind::filesystem:
        return "filesystem";
    case error_kind::timeout:
        return "timeout";
    case error_kind::cancelled:
        return "cancelled";
    }
    return "unknown";
}

download_error::download_error(error_kind kind, const std::string& message)
    : std::runtime_error(message), m_kind(kind) {}

server_status_error::server_status_error(int status_code)
    : download_error(error_kind::server_status, "http status " + std::to_string(status_code)),
      m_status_code(status_code) {}

} // namespace resumedl
