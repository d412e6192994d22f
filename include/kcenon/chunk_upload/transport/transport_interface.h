/**
 * @file transport_interface.h
 * @brief Remote transport abstraction layer interface
 * @version 0.1.0
 *
 * This file defines the capability set the upload engine needs from a remote
 * file server. FTP and SFTP backends implement it; tests substitute an
 * in-memory implementation.
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_INTERFACE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/chunk_upload/core/types.h"
#include "credential.h"
#include "transport_config.h"

namespace kcenon::chunk_upload {

/**
 * @brief How write_chunk opens the remote file
 */
enum class write_mode {
    create,  ///< Truncate or create, write at offset 0
    append   ///< Keep existing bytes, write at the given offset
};

/**
 * @brief Convert write_mode to string
 */
[[nodiscard]] constexpr auto to_string(write_mode mode) -> const char* {
    switch (mode) {
        case write_mode::create: return "create";
        case write_mode::append: return "append";
        default: return "unknown";
    }
}

/**
 * @brief Remote transport interface
 *
 * One instance wraps one connection. Every operation reports failures as
 * error values; none of them throw.
 *
 * @code
 * auto transport = create_transport(transfer_protocol::sftp, config);
 * if (transport) {
 *     auto connected = transport.value()->connect(endpoint{"backup.example.com", 22});
 *     if (connected) {
 *         transport.value()->authenticate("deploy", classify_credential(secret));
 *     }
 * }
 * @endcode
 */
class remote_transport {
public:
    virtual ~remote_transport() = default;

    // Non-copyable
    remote_transport(const remote_transport&) = delete;
    auto operator=(const remote_transport&) -> remote_transport& = delete;

    /**
     * @brief Protocol implemented by this transport
     */
    [[nodiscard]] virtual auto protocol() const -> transfer_protocol = 0;

    // ========================================================================
    // Connection Management
    // ========================================================================

    /**
     * @brief Open a connection to the remote endpoint
     * @param remote Host and port
     * @return Success, or connection_failed / connection_timeout
     */
    [[nodiscard]] virtual auto connect(const endpoint& remote) -> result<void> = 0;

    /**
     * @brief Authenticate the open connection
     *
     * Key material is tried first where the backend supports it. The
     * endpoint and credential are remembered for reconnect().
     *
     * @return Success, or credential_rejected / key_load_failed /
     *         authentication_failed
     */
    [[nodiscard]] virtual auto authenticate(const std::string& user, const credential& cred)
        -> result<void> = 0;

    /**
     * @brief Check whether the connection is usable
     */
    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    /**
     * @brief Drop the connection and connect/authenticate again
     */
    [[nodiscard]] virtual auto reconnect() -> result<void> = 0;

    /**
     * @brief Close the connection (no-op when closed)
     */
    virtual void close() = 0;

    /**
     * @brief Server identification (banner or SSH version string)
     */
    [[nodiscard]] virtual auto server_identification() const -> std::string = 0;

    // ========================================================================
    // File Operations
    // ========================================================================

    /**
     * @brief Create every segment of a directory path from the root down
     *
     * "Already exists" is success. A failed intermediate segment is logged
     * and tolerated when a later segment still succeeds.
     */
    [[nodiscard]] virtual auto ensure_remote_directory(const std::string& path) -> result<void> = 0;

    /**
     * @brief Write bytes to a remote file
     * @param path Remote file path
     * @param offset Position of the first byte (0 for write_mode::create)
     * @param data Bytes to write
     * @param mode create or append
     */
    [[nodiscard]] virtual auto write_chunk(const std::string& path,
                                           uint64_t offset,
                                           std::span<const std::byte> data,
                                           write_mode mode) -> result<void> = 0;

    /**
     * @brief Size of a remote file
     * @return Size, or std::nullopt when the file does not exist
     */
    [[nodiscard]] virtual auto remote_size(const std::string& path)
        -> result<std::optional<uint64_t>> = 0;

    /**
     * @brief Rename a remote file
     * @return Success, or partial_file_missing when the source is absent
     */
    [[nodiscard]] virtual auto rename(const std::string& from, const std::string& to)
        -> result<void> = 0;

    /**
     * @brief Delete a remote file (absent file is success)
     */
    [[nodiscard]] virtual auto remove(const std::string& path) -> result<void> = 0;

    // ========================================================================
    // Capabilities
    // ========================================================================

    /**
     * @brief Preferred size of verified sub-writes
     * @return Size for random-access transports, std::nullopt otherwise
     */
    [[nodiscard]] virtual auto preferred_sub_write_size() const -> std::optional<std::size_t> = 0;

protected:
    remote_transport() = default;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_INTERFACE_H
