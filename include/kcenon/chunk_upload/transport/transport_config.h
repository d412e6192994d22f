/**
 * @file transport_config.h
 * @brief Transport configuration types
 * @version 0.1.0
 *
 * This file defines configuration structures for the FTP and SFTP backends.
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_CONFIG_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::chunk_upload {

/**
 * @brief How an SFTP backend treats the server host key
 */
enum class host_key_policy {
    accept_any,   ///< Record the fingerprint in the log, never reject
    known_hosts   ///< Reject hosts missing from or mismatching known_hosts_path
};

/**
 * @brief Convert host_key_policy to string
 */
[[nodiscard]] constexpr auto to_string(host_key_policy policy) -> const char* {
    switch (policy) {
        case host_key_policy::accept_any: return "accept_any";
        case host_key_policy::known_hosts: return "known_hosts";
        default: return "unknown";
    }
}

/**
 * @brief Transport configuration shared by all backends
 */
struct transport_config {
    /// Connection timeout
    std::chrono::milliseconds connect_timeout{30000};

    /// Per-operation timeout (0 = no timeout)
    std::chrono::milliseconds operation_timeout{60000};

    /// Keep-alive enabled
    bool keep_alive = true;

    /// Keep-alive interval
    std::chrono::seconds keep_alive_interval{10};

    /// FTP: use passive mode for data connections
    bool ftp_passive = true;

    /// SFTP: host key verification policy
    host_key_policy sftp_host_key_policy = host_key_policy::accept_any;

    /// SFTP: known_hosts file used with host_key_policy::known_hosts
    std::optional<std::string> known_hosts_path;

    /// Sub-write size reported by random-access backends (SFTP)
    std::size_t sub_write_size = 1024 * 1024;
};

/**
 * @brief Transport configuration builder
 *
 * @code
 * auto config = transport_config_builder()
 *     .with_connect_timeout(std::chrono::seconds{10})
 *     .with_operation_timeout(std::chrono::seconds{120})
 *     .with_known_hosts("/home/deploy/.ssh/known_hosts")
 *     .build();
 * @endcode
 */
class transport_config_builder {
public:
    transport_config_builder() = default;

    auto with_connect_timeout(std::chrono::milliseconds timeout) -> transport_config_builder& {
        config_.connect_timeout = timeout;
        return *this;
    }

    auto with_operation_timeout(std::chrono::milliseconds timeout) -> transport_config_builder& {
        config_.operation_timeout = timeout;
        return *this;
    }

    auto with_keep_alive(bool enable, std::chrono::seconds interval = std::chrono::seconds{10})
        -> transport_config_builder& {
        config_.keep_alive = enable;
        config_.keep_alive_interval = interval;
        return *this;
    }

    auto with_ftp_passive(bool enable) -> transport_config_builder& {
        config_.ftp_passive = enable;
        return *this;
    }

    auto with_known_hosts(const std::string& path) -> transport_config_builder& {
        config_.sftp_host_key_policy = host_key_policy::known_hosts;
        config_.known_hosts_path = path;
        return *this;
    }

    auto with_host_key_policy(host_key_policy policy) -> transport_config_builder& {
        config_.sftp_host_key_policy = policy;
        return *this;
    }

    auto with_sub_write_size(std::size_t size) -> transport_config_builder& {
        config_.sub_write_size = size;
        return *this;
    }

    /**
     * @brief Build configuration
     * @return Transport configuration
     */
    [[nodiscard]] auto build() const -> transport_config {
        return config_;
    }

private:
    transport_config config_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_CONFIG_H
