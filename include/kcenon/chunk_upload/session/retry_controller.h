/**
 * @file retry_controller.h
 * @brief Bounded retry with backoff and reconnection
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_RETRY_CONTROLLER_H
#define KCENON_CHUNK_UPLOAD_SESSION_RETRY_CONTROLLER_H

#include <kcenon/chunk_upload/core/error_codes.h>
#include <kcenon/chunk_upload/core/types.h>
#include <kcenon/chunk_upload/session/retry_policy.h>
#include <kcenon/chunk_upload/transport/transport_interface.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::chunk_upload {

/**
 * @brief Function used to wait between attempts
 */
using sleeper_fn = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sleeper that blocks the calling thread
 */
[[nodiscard]] auto thread_sleeper() -> sleeper_fn;

/**
 * @brief Runs transport operations under a retry policy
 *
 * Each retryable failure is followed by a backoff delay; when the transport
 * then reports is_connected() == false it is reconnected before the next
 * attempt. Non-retryable errors return at once. One controller serves one
 * engine call; attempts() and reconnects() accumulate over that call.
 *
 * @code
 * retry_controller retry(policy, thread_sleeper());
 * auto written = retry.run<void>("write", transport.get(), [&] {
 *     return transport->write_chunk(path, offset, data, write_mode::append);
 * });
 * @endcode
 */
class retry_controller {
public:
    explicit retry_controller(retry_policy policy, sleeper_fn sleeper = thread_sleeper());

    /**
     * @brief Run an operation until it succeeds or the budget is spent
     *
     * @param operation Name used in logs and error messages
     * @param transport Transport to reconnect between attempts (nullptr to skip)
     * @param op Operation to run
     * @param exhausted_code Code reported when the budget is spent
     *        (defaults to the last cause)
     */
    template <typename T>
    [[nodiscard]] auto run(std::string_view operation,
                           remote_transport* transport,
                           const std::function<result<T>()>& op,
                           std::optional<error_code> exhausted_code = std::nullopt) -> result<T> {
        const std::size_t budget = max_attempts();
        struct error last_error{error_code::internal_error, "operation was not attempted"};

        for (std::size_t attempt = 1; attempt <= budget; ++attempt) {
            ++attempts_;
            last_run_attempts_ = attempt;

            result<T> outcome = op();
            if (outcome) {
                return outcome;
            }

            last_error = outcome.error();
            if (!is_retryable(last_error.code)) {
                log_fatal(operation, attempt, last_error);
                return outcome;
            }

            if (attempt == budget) {
                break;
            }

            if (auto recovered = recover(operation, attempt, last_error, transport); !recovered) {
                return unexpected(recovered.error());
            }
        }

        return unexpected(exhausted(operation, budget, last_error, exhausted_code));
    }

    /**
     * @brief Total attempts made through this controller
     */
    [[nodiscard]] auto attempts() const noexcept -> std::size_t { return attempts_; }

    /**
     * @brief Attempts made by the most recent run()
     */
    [[nodiscard]] auto last_run_attempts() const noexcept -> std::size_t { return last_run_attempts_; }

    /**
     * @brief Reconnections performed through this controller
     */
    [[nodiscard]] auto reconnects() const noexcept -> std::size_t { return reconnects_; }

    [[nodiscard]] auto policy() const noexcept -> const retry_policy& { return policy_; }

    /**
     * @brief Remove @p secret from every failure message this controller logs
     */
    void redact_secret(std::string secret) { secret_ = std::move(secret); }

private:
    [[nodiscard]] auto max_attempts() const noexcept -> std::size_t;

    /**
     * @brief Wait, then reconnect when the transport lost its connection
     * @return Success, or a non-retryable reconnect error that ends the run
     */
    [[nodiscard]] auto recover(std::string_view operation,
                               std::size_t attempt,
                               const error& cause,
                               remote_transport* transport) -> result<void>;

    [[nodiscard]] auto exhausted(std::string_view operation,
                                 std::size_t attempts,
                                 const error& cause,
                                 std::optional<error_code> exhausted_code) const -> error;

    void log_fatal(std::string_view operation, std::size_t attempt, const error& cause) const;

    [[nodiscard]] auto scrub(const std::string& message) const -> std::string;

    retry_policy policy_;
    sleeper_fn sleeper_;
    std::string secret_;
    std::size_t attempts_ = 0;
    std::size_t last_run_attempts_ = 0;
    std::size_t reconnects_ = 0;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_RETRY_CONTROLLER_H
