/**
 * @file transfer_session.cpp
 * @brief Implementation of the per-call transfer state machine
 */

#include <kcenon/chunk_upload/session/transfer_session.h>
#include <kcenon/chunk_upload/core/logging.h>
#include <kcenon/chunk_upload/session/resume_reconciler.h>
#include <kcenon/chunk_upload/transport/credential.h>
#include <kcenon/chunk_upload/transport/transport_factory.h>

#include <algorithm>
#include <chrono>
#include <span>

namespace kcenon::chunk_upload {

namespace {

auto make_policy(const engine_config& config, const transfer_request& request) -> retry_policy {
    retry_policy policy = config.retry;
    if (request.max_retries && *request.max_retries > 0) {
        policy.max_attempts = *request.max_retries;
    }
    return policy;
}

auto local_path_for(const std::filesystem::path& root, const std::string& file)
    -> std::filesystem::path {
    const auto relative = std::filesystem::path(normalize_remote_path(file)).relative_path();
    return root.empty() ? relative : root / relative;
}

}  // namespace

auto is_valid_transition(session_state from, session_state to) noexcept -> bool {
    if (to == session_state::failed) {
        return from != session_state::done && from != session_state::failed;
    }

    switch (from) {
        case session_state::init:
            return to == session_state::reconcile;
        case session_state::reconcile:
            return to == session_state::read_local || to == session_state::done;
        case session_state::read_local:
            return to == session_state::upload;
        case session_state::upload:
            return to == session_state::finalize || to == session_state::done;
        case session_state::finalize:
            return to == session_state::done;
        case session_state::done:
        case session_state::failed:
            return false;
    }
    return false;
}

transfer_session::transfer_session(const engine_config& config, transfer_request request)
    : config_(config),
      request_(std::move(request)),
      retry_(make_policy(config_, request_), config_.sleeper),
      current_offset_(request_.offset) {
    retry_.redact_secret(request_.credential);
    history_.push_back(state_);
}

transfer_session::~transfer_session() {
    release_transport();
}

auto transfer_session::transition(session_state next) -> result<void> {
    if (!is_valid_transition(state_, next)) {
        return unexpected(error{error_code::internal_error,
                                std::string("invalid session transition ") + to_string(state_) +
                                    " -> " + to_string(next)});
    }
    state_ = next;
    history_.push_back(next);
    return {};
}

auto transfer_session::run() -> transfer_result {
    if (history_.size() > 1) {
        return transfer_result::make_failure(
            error{error_code::invalid_request, "transfer session has already run"},
            request_.file, request_.offset);
    }

    const auto started = std::chrono::steady_clock::now();

    if (auto ready = initialize(); !ready) {
        return fail(ready.error());
    }

    // Reconcile
    if (auto moved = transition(session_state::reconcile); !moved) {
        return fail(moved.error());
    }

    const uint64_t size = source_->size();
    auto reconciled = reconcile_offset(*transport_, retry_, target_, request_.offset, size);
    if (!reconciled) {
        return fail(reconciled.error());
    }
    current_offset_ = reconciled.value().offset;
    reconciliation_ = reconciled.value().action;

    transfer_result outcome;
    outcome.success = true;
    outcome.file_size = size;
    outcome.requested_offset = request_.offset;
    outcome.reconciled_offset = current_offset_;
    outcome.reconciliation = reconciliation_;

    if (reconciliation_ == reconcile_action::already_finalized) {
        if (auto moved = transition(session_state::done); !moved) {
            return fail(moved.error());
        }
        outcome.new_offset = size;
        outcome.complete = true;
        outcome.percent = 100.0;
        outcome.attempts = retry_.attempts();
        outcome.reconnects = retry_.reconnects();
        release_transport();
        return outcome;
    }

    // Read the planned range
    if (auto moved = transition(session_state::read_local); !moved) {
        return fail(moved.error());
    }

    const uint64_t chunk_size = request_.chunk_size.value_or(config_.default_chunk_size);
    auto plan = plan_chunk(size, chunk_size, current_offset_);
    if (!plan) {
        return fail(plan.error());
    }

    std::vector<std::byte> data;
    if (plan.value().length > 0) {
        auto bytes = source_->read(plan.value().offset, plan.value().length);
        if (!bytes) {
            return fail(bytes.error());
        }
        data = std::move(bytes.value());
    }

    // Upload
    if (auto moved = transition(session_state::upload); !moved) {
        return fail(moved.error());
    }

    if (auto written = upload(plan.value(), data); !written) {
        return fail(written.error());
    }

    if (plan.value().is_final) {
        if (auto moved = transition(session_state::finalize); !moved) {
            return fail(moved.error());
        }
        if (auto finalized = finalize(); !finalized) {
            return fail(finalized.error());
        }
    }

    if (auto moved = transition(session_state::done); !moved) {
        return fail(moved.error());
    }

    outcome.new_offset = plan.value().end();
    outcome.bytes_sent = plan.value().length;
    outcome.complete = plan.value().is_final;
    outcome.percent = completion_percent(outcome.new_offset, size);
    outcome.attempts = retry_.attempts();
    outcome.reconnects = retry_.reconnects();

    transfer_log_context ctx;
    ctx.file = request_.file;
    ctx.remote_path = outcome.complete ? target_.final_path : target_.partial_path;
    ctx.protocol = to_string(protocol_);
    ctx.offset = outcome.new_offset;
    ctx.file_size = size;
    ctx.bytes_sent = outcome.bytes_sent;
    ctx.progress_percent = outcome.percent;
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    if (outcome.complete) {
        CU_LOG_INFO_CTX(log_category::session, "File upload completed", ctx);
    } else {
        CU_LOG_DEBUG_CTX(log_category::session, "Chunk uploaded", ctx);
    }

    release_transport();
    return outcome;
}

// ============================================================================
// init
// ============================================================================

auto transfer_session::validate_request() -> result<void> {
    if (request_.protocol.empty()) {
        return unexpected(error{error_code::missing_field, "protocol is required"});
    }
    auto protocol = parse_protocol(request_.protocol);
    if (!protocol) {
        return unexpected(error{error_code::invalid_protocol,
                                "unsupported protocol '" + request_.protocol + "'"});
    }
    protocol_ = *protocol;

    if (request_.host.empty()) {
        return unexpected(error{error_code::missing_field, "host is required"});
    }
    if (request_.user.empty()) {
        return unexpected(error{error_code::missing_field, "user is required"});
    }
    if (request_.file.empty()) {
        return unexpected(error{error_code::missing_field, "file is required"});
    }
    if (request_.chunk_size && *request_.chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "chunk size must be positive"});
    }
    if (request_.max_retries && *request_.max_retries == 0) {
        return unexpected(error{error_code::invalid_request, "max_retries must be positive"});
    }

    auto target = make_remote_target(request_.remote_dir, request_.file);
    if (!target) {
        return unexpected(target.error());
    }
    target_ = target.value();
    return {};
}

auto transfer_session::open_transport() -> result<void> {
    const auto& factory = config_.factory ? config_.factory : transport_factory_fn(create_transport);
    auto created = factory(protocol_, config_.transport);
    if (!created) {
        return unexpected(created.error());
    }
    transport_ = std::move(created.value());
    if (!transport_) {
        return unexpected(error{error_code::internal_error, "transport factory returned null"});
    }

    const endpoint remote{request_.host,
                          request_.port != 0 ? request_.port : default_port(protocol_)};
    const credential cred = classify_credential(request_.credential);

    CU_LOG_DEBUG(log_category::session,
                 std::string("Connecting to ") + to_string(protocol_) + "://" + remote.to_string() +
                     " using " + to_string(cred.kind) + " credential");

    auto connected = retry_.run<void>("connect " + remote.to_string(), nullptr, [&]() -> result<void> {
        transport_->close();
        if (auto opened = transport_->connect(remote); !opened) {
            return opened;
        }
        return transport_->authenticate(request_.user, cred);
    });
    if (!connected) {
        return connected;
    }

    if (!target_.directory.empty() && target_.directory != "/") {
        auto created_dir = retry_.run<void>("mkdir " + target_.directory, transport_.get(), [&]() {
            return transport_->ensure_remote_directory(target_.directory);
        });
        if (!created_dir) {
            return created_dir;
        }
    }
    return {};
}

auto transfer_session::initialize() -> result<void> {
    if (auto valid = validate_request(); !valid) {
        return valid;
    }

    auto opened = local_source::open(local_path_for(config_.local_root, request_.file));
    if (!opened) {
        return unexpected(opened.error());
    }
    source_.emplace(std::move(opened).value());

    if (request_.offset > source_->size()) {
        return unexpected(error{error_code::invalid_offset,
                                "offset " + std::to_string(request_.offset) +
                                    " exceeds file size " + std::to_string(source_->size())});
    }

    return open_transport();
}

// ============================================================================
// upload
// ============================================================================

auto transfer_session::verify_remote_size(const std::string& path, uint64_t expected)
    -> result<uint64_t> {
    auto size = retry_.run<std::optional<uint64_t>>(
        "stat " + path, transport_.get(), [&]() { return transport_->remote_size(path); });
    if (!size) {
        return unexpected(size.error());
    }
    const uint64_t actual = size.value().value_or(0);
    if (actual != expected) {
        return unexpected(error{error_code::remote_size_mismatch,
                                path + " is " + std::to_string(actual) + " bytes, expected " +
                                    std::to_string(expected)});
    }
    return actual;
}

auto transfer_session::upload(const chunk_plan& plan, const std::vector<std::byte>& data)
    -> result<void> {
    if (plan.length == 0) {
        return {};
    }

    const auto sub_write = transport_->preferred_sub_write_size();
    const bool verify_each = sub_write.has_value() && *sub_write > 0;
    const uint64_t piece_size = verify_each ? std::min<uint64_t>(*sub_write, plan.length) : plan.length;
    const std::size_t local_retries = verify_each ? config_.verify_retries : 0;
    const std::span<const std::byte> bytes(data);

    for (uint64_t done = 0; done < plan.length; done += piece_size) {
        const uint64_t position = plan.offset + done;
        const uint64_t length = std::min<uint64_t>(piece_size, plan.length - done);
        const auto piece = bytes.subspan(static_cast<std::size_t>(done), static_cast<std::size_t>(length));
        const write_mode mode = position == 0 ? write_mode::create : write_mode::append;

        for (std::size_t local_try = 0;; ++local_try) {
            auto written = retry_.run<void>("write " + target_.partial_path, transport_.get(), [&]() {
                return transport_->write_chunk(target_.partial_path, position, piece, mode);
            });
            if (!written) {
                return written;
            }

            auto verified = verify_remote_size(target_.partial_path, position + length);
            if (verified) {
                break;
            }
            if (verified.error().code != error_code::remote_size_mismatch ||
                local_try >= local_retries) {
                return unexpected(verified.error());
            }

            transfer_log_context ctx;
            ctx.file = request_.file;
            ctx.remote_path = target_.partial_path;
            ctx.offset = position;
            ctx.attempt = static_cast<uint32_t>(local_try + 1);
            ctx.error_message = verified.error().message;
            CU_LOG_WARN_CTX(log_category::session, "Sub-write did not verify; rewriting", ctx);
        }

        current_offset_ = position + length;
    }
    return {};
}

// ============================================================================
// finalize
// ============================================================================

auto transfer_session::finalize() -> result<void> {
    const uint64_t size = source_->size();

    auto removed = retry_.run<void>(
        "delete " + target_.final_path, transport_.get(),
        [&]() { return transport_->remove(target_.final_path); }, error_code::pre_delete_failed);
    if (!removed) {
        return removed;
    }

    auto renamed = retry_.run<void>(
        "rename " + target_.partial_path, transport_.get(),
        [&]() { return transport_->rename(target_.partial_path, target_.final_path); },
        error_code::rename_failed);
    if (!renamed) {
        if (renamed.error().code != error_code::partial_file_missing) {
            return renamed;
        }
        // A rename whose reply was lost looks like a missing source on retry.
        auto final_size = retry_.run<std::optional<uint64_t>>(
            "stat " + target_.final_path, transport_.get(),
            [&]() { return transport_->remote_size(target_.final_path); });
        if (!final_size || final_size.value() != size) {
            return renamed;
        }
        CU_LOG_INFO(log_category::session,
                    "Rename of " + target_.partial_path + " was applied by an earlier attempt");
    }

    auto verified = verify_remote_size(target_.final_path, size);
    if (verified) {
        return {};
    }
    if (verified.error().code != error_code::remote_size_mismatch) {
        return unexpected(verified.error());
    }

    CU_LOG_ERROR(log_category::session,
                 "Final file has the wrong size, removing it: " + verified.error().message);
    auto cleanup = retry_.run<void>("delete " + target_.final_path, transport_.get(),
                                    [&]() { return transport_->remove(target_.final_path); });
    if (!cleanup) {
        CU_LOG_ERROR(log_category::session,
                     "Could not remove corrupt final file: " + cleanup.error().message);
    }
    return unexpected(error{error_code::final_size_mismatch, verified.error().message});
}

// ============================================================================
// failed
// ============================================================================

auto transfer_session::fail(const error& cause) -> transfer_result {
    if (state_ != session_state::failed) {
        state_ = session_state::failed;
        history_.push_back(state_);
    }

    // Backend messages may echo a login URL or the secret itself
    const error err{cause.code, sensitive_info_masker::redact(
                                    sensitive_info_masker::redact_url_credentials(cause.message),
                                    request_.credential)};

    transfer_log_context ctx;
    ctx.file = request_.file;
    ctx.protocol = request_.protocol;
    ctx.server_address = request_.host;
    ctx.offset = current_offset_;
    ctx.attempt = static_cast<uint32_t>(retry_.attempts());
    ctx.error_message = err.message;
    CU_LOG_ERROR_CTX(log_category::session,
                     std::string("Chunk transfer failed: ") + to_string(err.code), ctx);

    auto outcome = transfer_result::make_failure(err, request_.file, current_offset_);
    outcome.requested_offset = request_.offset;
    outcome.reconciliation = reconciliation_;
    if (source_) {
        outcome.file_size = source_->size();
    }
    outcome.attempts = retry_.attempts();
    outcome.reconnects = retry_.reconnects();

    release_transport();
    return outcome;
}

void transfer_session::release_transport() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

}  // namespace kcenon::chunk_upload
