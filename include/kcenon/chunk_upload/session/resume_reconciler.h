/**
 * @file resume_reconciler.h
 * @brief Reconciliation of the caller's offset with the remote partial file
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_RESUME_RECONCILER_H
#define KCENON_CHUNK_UPLOAD_SESSION_RESUME_RECONCILER_H

#include <kcenon/chunk_upload/core/remote_path.h>
#include <kcenon/chunk_upload/core/types.h>
#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/transport/transport_interface.h>

#include <cstdint>

namespace kcenon::chunk_upload {

/**
 * @brief What the reconciler decided about the caller's offset
 */
enum class reconcile_action {
    trusted,            ///< Remote size equals the requested offset
    remote_ahead,       ///< Remote partial is longer; a previous response was lost
    remote_behind,      ///< Remote partial is shorter; the caller was optimistic
    reset_oversized,    ///< Partial exceeded the source size and was deleted
    already_finalized   ///< Final file is complete; nothing left to send
};

[[nodiscard]] constexpr auto to_string(reconcile_action action) -> const char* {
    switch (action) {
        case reconcile_action::trusted: return "trusted";
        case reconcile_action::remote_ahead: return "remote_ahead";
        case reconcile_action::remote_behind: return "remote_behind";
        case reconcile_action::reset_oversized: return "reset_oversized";
        case reconcile_action::already_finalized: return "already_finalized";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of reconciliation
 */
struct reconcile_outcome {
    uint64_t offset = 0;
    reconcile_action action = reconcile_action::trusted;
    std::optional<uint64_t> remote_partial_size;  ///< nullopt when no partial exists
};

/**
 * @brief Decide the true resume offset from remote state
 *
 * The remote partial size r is authoritative whenever r <= size: the result is
 * never beyond verified remote bytes and never leaves a gap. A partial larger
 * than the source is deleted and the upload restarts at 0. With no partial and
 * a requested offset above 0, a final file of exactly size bytes means the
 * previous call already finalized.
 *
 * Only the size is compared: a stale final file of the same size (an older
 * version of the file) is also reported as already_finalized and is not
 * replaced. Callers resuming after the final file may have changed should
 * restart at offset 0, which always uploads and replaces it.
 *
 * Queries and deletes run through the retry controller.
 *
 * @param transport Connected, authenticated transport
 * @param retry Retry controller of the current call
 * @param target Remote names for the file
 * @param requested_offset Offset supplied by the caller
 * @param size Local source size
 */
[[nodiscard]] auto reconcile_offset(remote_transport& transport,
                                    retry_controller& retry,
                                    const remote_target& target,
                                    uint64_t requested_offset,
                                    uint64_t size) -> result<reconcile_outcome>;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_RESUME_RECONCILER_H
