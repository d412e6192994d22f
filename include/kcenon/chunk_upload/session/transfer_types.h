/**
 * @file transfer_types.h
 * @brief Request, result and configuration types of the upload engine
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_TYPES_H
#define KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_TYPES_H

#include <kcenon/chunk_upload/core/chunk_planner.h>
#include <kcenon/chunk_upload/core/error_codes.h>
#include <kcenon/chunk_upload/core/types.h>
#include <kcenon/chunk_upload/session/resume_reconciler.h>
#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/session/retry_policy.h>
#include <kcenon/chunk_upload/transport/transport_config.h>
#include <kcenon/chunk_upload/transport/transport_factory.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::chunk_upload {

/**
 * @brief One chunk's worth of work
 *
 * Mirrors the engine call contract {protocol, host, port, user, credential,
 * remote_dir, file, offset, chunk_size, max_retries}.
 */
struct transfer_request {
    std::string protocol;      ///< "ftp" or "sftp"
    std::string host;
    uint16_t port = 0;         ///< 0 selects the protocol default
    std::string user;
    std::string credential;    ///< Password, private key text or key file path
    std::string remote_dir;    ///< Remote base directory (empty: login directory)
    std::string file;          ///< Path relative to the engine's local root
    uint64_t offset = 0;       ///< Offset the caller believes is confirmed
    std::optional<uint64_t> chunk_size;       ///< Defaults to the engine chunk size
    std::optional<std::size_t> max_retries;  ///< Overrides the engine retry budget
};

/**
 * @brief Structured description of a failed call
 */
struct transfer_failure {
    error_kind kind = error_kind::none;
    error_code code = error_code::success;
    std::string message;
    std::string file;
    uint64_t offset = 0;  ///< Offset at the time of failure
};

/**
 * @brief Outcome of one engine call
 */
struct transfer_result {
    bool success = false;
    uint64_t new_offset = 0;
    uint64_t bytes_sent = 0;
    uint64_t file_size = 0;
    bool complete = false;
    double percent = 0.0;

    uint64_t requested_offset = 0;
    uint64_t reconciled_offset = 0;
    std::optional<reconcile_action> reconciliation;

    std::size_t attempts = 0;    ///< Transport attempts made by the call
    std::size_t reconnects = 0;  ///< Reconnections made by the call

    std::optional<transfer_failure> failure;

    [[nodiscard]] static auto make_failure(const error& err,
                                           const std::string& file,
                                           uint64_t offset) -> transfer_result;

    /**
     * @brief Render the response of the engine call contract
     *
     * Success: {"success":true,"new_offset":..,"filesize":..,"percent":..,...}
     * Failure: {"success":false,"message":..,"file":..,"offset":..,...}
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Caller-owned progress of one file
 *
 * Invariant: 0 <= offset <= size, and offset == size exactly when complete.
 */
struct file_transfer_state {
    std::string file;
    uint64_t size = 0;
    uint64_t offset = 0;
    bool complete = false;

    file_transfer_state() = default;
    explicit file_transfer_state(std::string path) : file(std::move(path)) {}

    /**
     * @brief Apply the outcome of an engine call
     * @return false when the result is a failure (state is left unchanged)
     */
    auto apply(const transfer_result& outcome) -> bool;

    [[nodiscard]] auto percent() const noexcept -> double {
        return size == 0 ? 0.0 : completion_percent(offset, size);
    }
};

/**
 * @brief Upload engine configuration
 */
struct engine_config {
    /// Directory relative file paths are resolved against (empty: working directory)
    std::filesystem::path local_root;

    /// Chunk size used by requests that do not specify one
    uint64_t default_chunk_size = kcenon::chunk_upload::default_chunk_size;

    retry_policy retry;

    /// Local retries of a sub-write whose remote size does not verify
    std::size_t verify_retries = 3;

    transport_config transport;

    /// Wait function between attempts (defaults to thread_sleeper())
    sleeper_fn sleeper;

    /// Transport constructor (defaults to create_transport)
    transport_factory_fn factory;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_TYPES_H
