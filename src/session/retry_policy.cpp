/**
 * @file retry_policy.cpp
 * @brief Backoff schedule computation
 */

#include <kcenon/chunk_upload/session/retry_policy.h>

#include <algorithm>

namespace kcenon::chunk_upload {

auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    const double multiplier = std::max(policy.backoff_multiplier, 1.0);
    const auto cap = static_cast<double>(std::max(policy.max_delay, policy.initial_delay).count());

    auto delay = static_cast<double>(policy.initial_delay.count());
    for (std::size_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay, 0.0)));
}

}  // namespace kcenon::chunk_upload
