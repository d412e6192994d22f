/**
 * @file ftp_transport.h
 * @brief FTP transport implementation (libcurl)
 * @version 0.1.0
 *
 * This file implements remote_transport for FTP servers. Available when the
 * library is built with CHUNK_UPLOAD_HAS_FTP.
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_FTP_TRANSPORT_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_FTP_TRANSPORT_H

#include <memory>

#include "transport_interface.h"
#include "transport_config.h"

namespace kcenon::chunk_upload {

/**
 * @brief FTP transport implementation
 *
 * One libcurl easy handle is kept per transport so the control connection
 * is reused across operations. FTP has no random-access write, so
 * write_mode::append downloads the existing partial file, concatenates the
 * new bytes locally and uploads the whole file again. The credential is
 * always sent as a password.
 *
 * @code
 * auto transport = ftp_transport::create(transport_config_builder()
 *     .with_connect_timeout(std::chrono::seconds{10})
 *     .build());
 * transport->connect(endpoint{"ftp.example.com", 21});
 * transport->authenticate("deploy", classify_credential("secret"));
 * @endcode
 */
class ftp_transport : public remote_transport {
public:
    /**
     * @brief Create an FTP transport instance
     * @param config Transport configuration
     * @return Transport instance
     */
    [[nodiscard]] static auto create(const transport_config& config = {})
        -> std::unique_ptr<ftp_transport>;

    ~ftp_transport() override;

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
    explicit ftp_transport(transport_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_FTP_TRANSPORT_H
