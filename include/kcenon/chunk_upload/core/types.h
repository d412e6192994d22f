/**
 * @file types.h
 * @brief Core type definitions for chunk_upload_system
 */

#ifndef KCENON_CHUNK_UPLOAD_CORE_TYPES_H
#define KCENON_CHUNK_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::chunk_upload {

/**
 * @brief Error codes for chunked upload operations (-700 to -799)
 *
 * Error code ranges:
 * - -700 to -709: Request errors
 * - -710 to -719: Local source errors
 * - -720 to -729: Authentication errors
 * - -730 to -749: Transport errors
 * - -750 to -759: Integrity errors
 * - -760 to -769: Finalization errors
 * - -790 to -799: Internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Request errors (-700 to -709)
    invalid_request = -700,
    missing_field = -701,
    invalid_protocol = -702,
    invalid_chunk_size = -703,
    invalid_offset = -704,
    invalid_remote_path = -705,

    // Local source errors (-710 to -719)
    local_file_not_found = -710,
    local_file_empty = -711,
    local_file_unreadable = -712,
    local_short_read = -713,
    local_seek_failed = -714,

    // Authentication errors (-720 to -729)
    authentication_failed = -720,
    credential_rejected = -721,
    key_load_failed = -722,

    // Transport errors (-730 to -749)
    connection_failed = -730,
    connection_timeout = -731,
    connection_lost = -732,
    operation_timeout = -733,
    remote_busy = -734,
    remote_io_error = -735,
    remote_not_found = -736,
    directory_create_failed = -737,
    not_connected = -738,
    backend_unavailable = -739,

    // Integrity errors (-750 to -759)
    remote_size_mismatch = -750,
    final_size_mismatch = -751,

    // Finalization errors (-760 to -769)
    rename_failed = -760,
    pre_delete_failed = -761,
    partial_file_missing = -762,

    // Internal errors (-790 to -799)
    internal_error = -790,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success: return "success";
        case error_code::invalid_request: return "invalid request";
        case error_code::missing_field: return "missing field";
        case error_code::invalid_protocol: return "invalid protocol";
        case error_code::invalid_chunk_size: return "invalid chunk size";
        case error_code::invalid_offset: return "invalid offset";
        case error_code::invalid_remote_path: return "invalid remote path";
        case error_code::local_file_not_found: return "local file not found";
        case error_code::local_file_empty: return "local file is empty";
        case error_code::local_file_unreadable: return "local file unreadable";
        case error_code::local_short_read: return "short read from local file";
        case error_code::local_seek_failed: return "seek failed in local file";
        case error_code::authentication_failed: return "authentication failed";
        case error_code::credential_rejected: return "credential rejected";
        case error_code::key_load_failed: return "private key could not be loaded";
        case error_code::connection_failed: return "connection failed";
        case error_code::connection_timeout: return "connection timeout";
        case error_code::connection_lost: return "connection lost";
        case error_code::operation_timeout: return "operation timeout";
        case error_code::remote_busy: return "remote busy";
        case error_code::remote_io_error: return "remote i/o error";
        case error_code::remote_not_found: return "remote path not found";
        case error_code::directory_create_failed: return "remote directory creation failed";
        case error_code::not_connected: return "not connected";
        case error_code::backend_unavailable: return "transport backend unavailable";
        case error_code::remote_size_mismatch: return "remote size mismatch";
        case error_code::final_size_mismatch: return "final file size mismatch";
        case error_code::rename_failed: return "rename failed";
        case error_code::pre_delete_failed: return "delete before rename failed";
        case error_code::partial_file_missing: return "partial file missing";
        case error_code::internal_error: return "internal error";
        default: return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Remote transfer protocol
 */
enum class transfer_protocol {
    ftp,
    sftp
};

/**
 * @brief Convert transfer_protocol to string
 */
[[nodiscard]] constexpr auto to_string(transfer_protocol protocol) -> const char* {
    switch (protocol) {
        case transfer_protocol::ftp: return "ftp";
        case transfer_protocol::sftp: return "sftp";
        default: return "unknown";
    }
}

/**
 * @brief Parse a protocol name ("ftp" or "sftp", case-insensitive)
 * @return Protocol or std::nullopt when the name is not recognised
 */
[[nodiscard]] auto parse_protocol(std::string_view name) -> std::optional<transfer_protocol>;

/**
 * @brief Default port for a protocol (21 for FTP, 22 for SFTP)
 */
[[nodiscard]] constexpr auto default_port(transfer_protocol protocol) -> uint16_t {
    return protocol == transfer_protocol::sftp ? 22 : 21;
}

/**
 * @brief Network endpoint (host and port)
 */
struct endpoint {
    std::string host;
    uint16_t port = 0;

    endpoint() = default;
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }

    [[nodiscard]] auto operator==(const endpoint& other) const -> bool = default;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CORE_TYPES_H
