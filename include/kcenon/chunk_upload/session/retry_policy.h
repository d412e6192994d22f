/**
 * @file retry_policy.h
 * @brief Retry budget and exponential backoff schedule
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_RETRY_POLICY_H
#define KCENON_CHUNK_UPLOAD_SESSION_RETRY_POLICY_H

#include <chrono>
#include <cstddef>

namespace kcenon::chunk_upload {

/**
 * @brief Retry policy for transport operations
 */
struct retry_policy {
    /// Maximum attempts per operation, the first attempt included
    std::size_t max_attempts = 5;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound of any single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff (values below 1.0 act as 1.0)
    double backoff_multiplier = 2.0;
};

/**
 * @brief Delay to wait after the given failed attempt
 *
 * min(initial_delay * multiplier^(attempt - 1), max_delay). The sequence is
 * monotonic non-decreasing in attempt.
 *
 * @param policy Retry policy
 * @param attempt Number of the attempt that just failed (1-based)
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_RETRY_POLICY_H
