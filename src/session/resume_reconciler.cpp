/**
 * @file resume_reconciler.cpp
 * @brief Implementation of offset reconciliation
 */

#include <kcenon/chunk_upload/session/resume_reconciler.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <string>

namespace kcenon::chunk_upload {

namespace {

auto query_size(remote_transport& transport, retry_controller& retry, const std::string& path)
    -> result<std::optional<uint64_t>> {
    return retry.run<std::optional<uint64_t>>(
        "stat " + path, &transport, [&]() { return transport.remote_size(path); });
}

}  // namespace

auto reconcile_offset(remote_transport& transport,
                      retry_controller& retry,
                      const remote_target& target,
                      uint64_t requested_offset,
                      uint64_t size) -> result<reconcile_outcome> {
    auto partial = query_size(transport, retry, target.partial_path);
    if (!partial) {
        return unexpected(partial.error());
    }

    transfer_log_context ctx;
    ctx.remote_path = target.partial_path;
    ctx.offset = requested_offset;
    ctx.file_size = size;

    reconcile_outcome outcome;
    outcome.remote_partial_size = partial.value();

    if (!partial.value().has_value() && requested_offset > 0) {
        auto final_size = query_size(transport, retry, target.final_path);
        if (!final_size) {
            return unexpected(final_size.error());
        }
        if (final_size.value() == size) {
            outcome.offset = size;
            outcome.action = reconcile_action::already_finalized;
            CU_LOG_INFO_CTX(log_category::reconcile,
                            "Final file already complete; treating call as replay", ctx);
            return outcome;
        }
    }

    const uint64_t remote = partial.value().value_or(0);

    if (remote > size) {
        CU_LOG_WARN_CTX(log_category::reconcile,
                        "Partial file (" + std::to_string(remote) +
                            " bytes) is larger than the source; restarting",
                        ctx);
        auto removed = retry.run<void>("delete " + target.partial_path, &transport,
                                       [&]() { return transport.remove(target.partial_path); });
        if (!removed) {
            return unexpected(removed.error());
        }
        outcome.offset = 0;
        outcome.action = reconcile_action::reset_oversized;
        return outcome;
    }

    outcome.offset = remote;
    if (remote == requested_offset) {
        outcome.action = reconcile_action::trusted;
    } else if (remote > requested_offset) {
        outcome.action = reconcile_action::remote_ahead;
        CU_LOG_INFO_CTX(log_category::reconcile,
                        "Remote partial is ahead; resuming at " + std::to_string(remote), ctx);
    } else {
        outcome.action = reconcile_action::remote_behind;
        CU_LOG_WARN_CTX(log_category::reconcile,
                        "Remote partial is behind; resuming at " + std::to_string(remote), ctx);
    }
    return outcome;
}

}  // namespace kcenon::chunk_upload
