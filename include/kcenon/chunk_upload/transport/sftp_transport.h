/**
 * @file sftp_transport.h
 * @brief SFTP transport implementation (libssh2)
 * @version 0.1.0
 *
 * This file implements remote_transport for SSH servers with the SFTP
 * subsystem. Available when the library is built with CHUNK_UPLOAD_HAS_SFTP.
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_SFTP_TRANSPORT_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_SFTP_TRANSPORT_H

#include <memory>

#include "transport_interface.h"
#include "transport_config.h"

namespace kcenon::chunk_upload {

/**
 * @brief SFTP transport implementation
 *
 * Uses a blocking libssh2 session over a plain TCP socket. Writes seek to
 * the requested offset, so chunks are appended in place and the engine can
 * verify sub-writes of preferred_sub_write_size() bytes.
 *
 * @code
 * auto transport = sftp_transport::create(transport_config_builder()
 *     .with_known_hosts("/home/deploy/.ssh/known_hosts")
 *     .build());
 * transport->connect(endpoint{"backup.example.com", 22});
 * transport->authenticate("deploy", classify_credential(private_key_pem));
 * @endcode
 */
class sftp_transport : public remote_transport {
public:
    /**
     * @brief Create an SFTP transport instance
     * @param config Transport configuration
     * @return Transport instance
     */
    [[nodiscard]] static auto create(const transport_config& config = {})
        -> std::unique_ptr<sftp_transport>;

    ~sftp_transport() override;

    // ========================================================================
    // remote_transport implementation
    // ========================================================================

    [[nodiscard]] auto protocol() const -> transfer_protocol override;

    // Connection Management
    [[nodiscard]] auto connect(const endpoint& remote) -> result<void> override;
    [[nodiscard]] auto authenticate(const std::string& user, const credential& cred)
        -> result<void> override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto reconnect() -> result<void> override;
    void close() override;
    [[nodiscard]] auto server_identification() const -> std::string override;

    // File Operations
    [[nodiscard]] auto ensure_remote_directory(const std::string& path) -> result<void> override;
    [[nodiscard]] auto write_chunk(const std::string& path,
                                   uint64_t offset,
                                   std::span<const std::byte> data,
                                   write_mode mode) -> result<void> override;
    [[nodiscard]] auto remote_size(const std::string& path)
        -> result<std::optional<uint64_t>> override;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> result<void> override;
    [[nodiscard]] auto remove(const std::string& path) -> result<void> override;

    // Capabilities
    [[nodiscard]] auto preferred_sub_write_size() const -> std::optional<std::size_t> override;

private:
    explicit sftp_transport(transport_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_SFTP_TRANSPORT_H
