/**
 * @file error_codes.h
 * @brief Error classification for chunk_upload_system
 * @version 0.1.0
 *
 * Every error_code belongs to exactly one error_kind. The kind is what a
 * caller reports; retryability decides whether the retry controller spends
 * budget on the failure or returns it immediately.
 */

#ifndef KCENON_CHUNK_UPLOAD_CORE_ERROR_CODES_H
#define KCENON_CHUNK_UPLOAD_CORE_ERROR_CODES_H

#include <kcenon/chunk_upload/core/types.h>

#include <string_view>

namespace kcenon::chunk_upload {

/**
 * @brief Caller-visible error categories
 */
enum class error_kind {
    none,                 ///< Not an error
    invalid_request,      ///< Missing or malformed field (fatal, never retried)
    local_source,         ///< Missing/empty/unreadable local file, short read (fatal)
    authentication,       ///< Credentials rejected or never accepted
    transient_transport,  ///< Connection drop, timeout, remote busy (retried)
    integrity,            ///< Remote size disagrees with expected size (fatal)
    finalization          ///< Rename or pre-delete failed after retries (fatal)
};

/**
 * @brief Convert error_kind to string
 */
[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::none: return "none";
        case error_kind::invalid_request: return "InvalidRequest";
        case error_kind::local_source: return "LocalSourceError";
        case error_kind::authentication: return "AuthenticationError";
        case error_kind::transient_transport: return "TransientTransportError";
        case error_kind::integrity: return "IntegrityError";
        case error_kind::finalization: return "FinalizationError";
        default: return "unknown";
    }
}

/**
 * @brief Map an error code to its kind
 */
[[nodiscard]] constexpr auto kind_of(error_code code) noexcept -> error_kind {
    const auto value = static_cast<int32_t>(code);
    if (value == 0) {
        return error_kind::none;
    }
    if (value <= -700 && value > -710) {
        return error_kind::invalid_request;
    }
    if (value <= -710 && value > -720) {
        return error_kind::local_source;
    }
    if (value <= -720 && value > -730) {
        return error_kind::authentication;
    }
    if (value <= -750 && value > -760) {
        return error_kind::integrity;
    }
    if (value <= -760 && value > -770) {
        return error_kind::finalization;
    }
    // Transport errors and unclassified internal failures are treated as
    // transient so they are retried and never silently dropped.
    return error_kind::transient_transport;
}

/**
 * @brief Check whether a single failed attempt may be retried
 *
 * authentication_failed covers a login that did not complete (dropped
 * session, timeout during auth) and is retried; credential_rejected and
 * key_load_failed are definitive answers and are not.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::authentication_failed:
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::operation_timeout:
        case error_code::remote_busy:
        case error_code::remote_io_error:
        case error_code::directory_create_failed:
        case error_code::not_connected:
        case error_code::rename_failed:
        case error_code::pre_delete_failed:
        case error_code::internal_error:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check whether a failure means the connection itself is gone
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept -> bool {
    return code == error_code::connection_failed ||
           code == error_code::connection_timeout ||
           code == error_code::connection_lost ||
           code == error_code::operation_timeout;
}

/**
 * @brief Convenience overload for error values
 */
[[nodiscard]] inline auto is_retryable(const error& err) noexcept -> bool {
    return is_retryable(err.code);
}

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CORE_ERROR_CODES_H
