/**
 * @file transfer_session.h
 * @brief State machine executing one chunk of one file
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_SESSION_H
#define KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_SESSION_H

#include <kcenon/chunk_upload/core/chunk_planner.h>
#include <kcenon/chunk_upload/core/local_source.h>
#include <kcenon/chunk_upload/core/remote_path.h>
#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/session/transfer_types.h>
#include <kcenon/chunk_upload/transport/transport_interface.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Session states
 *
 * init -> reconcile -> read_local -> upload -> (done | finalize -> done);
 * any non-terminal state may move to failed.
 */
enum class session_state {
    init,
    reconcile,
    read_local,
    upload,
    finalize,
    done,
    failed
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::init: return "init";
        case session_state::reconcile: return "reconcile";
        case session_state::read_local: return "read_local";
        case session_state::upload: return "upload";
        case session_state::finalize: return "finalize";
        case session_state::done: return "done";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Check a state transition against the session transition table
 */
[[nodiscard]] auto is_valid_transition(session_state from, session_state to) noexcept -> bool;

/**
 * @brief Executes a single engine call
 *
 * A session is created for one transfer_request, owns the transport for the
 * duration of run() and is discarded afterwards. Nothing survives the call
 * except the returned transfer_result and the remote files.
 *
 * Failures leave the remote partial file in place so a later call can resume
 * from it.
 */
class transfer_session {
public:
    transfer_session(const engine_config& config, transfer_request request);
    ~transfer_session();

    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;

    /**
     * @brief Run the state machine to a terminal state
     *
     * May be called once; later calls report invalid_request.
     */
    [[nodiscard]] auto run() -> transfer_result;

    [[nodiscard]] auto state() const noexcept -> session_state { return state_; }

    /**
     * @brief States visited so far, in order
     */
    [[nodiscard]] auto history() const -> const std::vector<session_state>& { return history_; }

private:
    [[nodiscard]] auto transition(session_state next) -> result<void>;

    [[nodiscard]] auto initialize() -> result<void>;
    [[nodiscard]] auto validate_request() -> result<void>;
    [[nodiscard]] auto open_transport() -> result<void>;

    [[nodiscard]] auto upload(const chunk_plan& plan, const std::vector<std::byte>& data)
        -> result<void>;
    [[nodiscard]] auto verify_remote_size(const std::string& path, uint64_t expected)
        -> result<uint64_t>;

    [[nodiscard]] auto finalize() -> result<void>;

    [[nodiscard]] auto fail(const error& cause) -> transfer_result;
    void release_transport();

    const engine_config& config_;
    transfer_request request_;
    retry_controller retry_;

    session_state state_ = session_state::init;
    std::vector<session_state> history_;

    transfer_protocol protocol_ = transfer_protocol::sftp;
    remote_target target_;
    std::optional<local_source> source_;
    std::unique_ptr<remote_transport> transport_;

    std::optional<reconcile_action> reconciliation_;
    uint64_t current_offset_ = 0;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_TRANSFER_SESSION_H
