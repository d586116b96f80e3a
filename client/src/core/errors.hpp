#pragma once

#include <stdexcept>
#include <string>

namespace resumedl {

enum class error_kind {
    validation,
    network,
    rejected,
    server_status,
    filesystem,
    timeout,
    cancelled,
};

const char* to_string(error_kind kind);

// Base of every failure surfaced by the download engine.
class download_error : public std::runtime_error {
public:
    download_error(error_kind kind, const std::string& message);

    error_kind kind() const noexcept {
        return m_kind;
    }

private:
    error_kind m_kind;
};

// Malformed URL or request that cannot be constructed.
class validation_error : public download_error {
public:
    explicit validation_error(const std::string& message)
        : download_error(error_kind::validation, message) {}
};

// Transport failure on HEAD or GET.
class network_error : public download_error {
public:
    explicit network_error(const std::string& message)
        : download_error(error_kind::network, message) {}
};

// The accept predicate vetoed the download.
class rejected_error : public download_error {
public:
    explicit rejected_error(const std::string& message)
        : download_error(error_kind::rejected, message) {}
};

class server_status_error : public download_error {
public:
    explicit server_status_error(int status_code);

    int status_code() const noexcept {
        return m_status_code;
    }

private:
    int m_status_code;
};

// Target file cannot be opened or written.
class filesystem_error : public download_error {
public:
    explicit filesystem_error(const std::string& message)
        : download_error(error_kind::filesystem, message) {}
};

// Inactivity deadline exceeded.
class timeout_error : public download_error {
public:
    explicit timeout_error(const std::string& message = "inactivity timeout exceeded")
        : download_error(error_kind::timeout, message) {}
};

// Cancellation requested by the caller.
class cancelled_error : public download_error {
public:
    explicit cancelled_error(const std::string& message = "context canceled")
        : download_error(error_kind::cancelled, message) {}
};

} // namespace resumedl
