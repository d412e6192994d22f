/**
 * @file retry_controller.cpp
 * @brief Implementation of bounded retry with reconnection
 */

#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <thread>

namespace kcenon::chunk_upload {

auto thread_sleeper() -> sleeper_fn {
    return [](std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

retry_controller::retry_controller(retry_policy policy, sleeper_fn sleeper)
    : policy_(policy), sleeper_(sleeper ? std::move(sleeper) : thread_sleeper()) {}

auto retry_controller::max_attempts() const noexcept -> std::size_t {
    return policy_.max_attempts == 0 ? 1 : policy_.max_attempts;
}

auto retry_controller::recover(std::string_view operation,
                               std::size_t attempt,
                               const error& cause,
                               remote_transport* transport) -> result<void> {
    const auto delay = calculate_retry_delay(policy_, attempt);

    transfer_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.error_message = scrub(cause.message);
    CU_LOG_WARN_CTX(log_category::retry,
                    std::string(operation) + " failed, retrying in " +
                        std::to_string(delay.count()) + "ms",
                    ctx);

    sleeper_(delay);

    if (transport == nullptr || transport->is_connected()) {
        return {};
    }

    ++reconnects_;
    auto reconnected = transport->reconnect();
    if (reconnected) {
        CU_LOG_INFO(log_category::retry,
                    "Reconnected before retrying " + std::string(operation));
        return {};
    }

    if (!is_retryable(reconnected.error().code)) {
        log_fatal("reconnect", attempt, reconnected.error());
        return reconnected;
    }

    // The next attempt runs against a dead connection and fails again, which
    // schedules another reconnect.
    CU_LOG_WARN(log_category::retry, "Reconnect failed: " + scrub(reconnected.error().message));
    return {};
}

auto retry_controller::exhausted(std::string_view operation,
                                 std::size_t attempts,
                                 const error& cause,
                                 std::optional<error_code> exhausted_code) const -> error {
    const auto code = exhausted_code.value_or(cause.code);

    transfer_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempts);
    ctx.error_message = scrub(cause.message);
    CU_LOG_ERROR_CTX(log_category::retry,
                     std::string(operation) + " gave up after " + std::to_string(attempts) +
                         " attempts",
                     ctx);

    return error{code, std::string(operation) + " failed after " + std::to_string(attempts) +
                           " attempts: " + scrub(cause.message)};
}

void retry_controller::log_fatal(std::string_view operation,
                                 std::size_t attempt,
                                 const error& cause) const {
    transfer_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.error_message = scrub(cause.message);
    CU_LOG_ERROR_CTX(log_category::retry,
                     std::string(operation) + " failed with a non-retryable error (" +
                         to_string(cause.code) + ")",
                     ctx);
}

auto retry_controller::scrub(const std::string& message) const -> std::string {
    return sensitive_info_masker::redact(sensitive_info_masker::redact_url_credentials(message),
                                         secret_);
}

}  // namespace kcenon::chunk_upload
