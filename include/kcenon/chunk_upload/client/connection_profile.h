/**
 * @file connection_profile.h
 * @brief Caller-side description of a remote destination
 */

#ifndef KCENON_CHUNK_UPLOAD_CLIENT_CONNECTION_PROFILE_H
#define KCENON_CHUNK_UPLOAD_CLIENT_CONNECTION_PROFILE_H

#include <kcenon/chunk_upload/core/chunk_planner.h>
#include <kcenon/chunk_upload/core/types.h>
#include <kcenon/chunk_upload/session/transfer_types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::chunk_upload {

/**
 * @brief Stored connection settings
 *
 * The engine never persists profiles; loading and saving them is the
 * caller's concern.
 */
struct connection_profile {
    transfer_protocol protocol = transfer_protocol::sftp;
    std::string host;
    uint16_t port = 0;  ///< 0 selects the protocol default
    std::string user;
    std::string credential;
    std::string remote_dir;
    uint64_t chunk_size = default_chunk_size;
    std::size_t max_retries = 5;

    [[nodiscard]] auto remote_endpoint() const -> endpoint {
        return endpoint{host, port != 0 ? port : default_port(protocol)};
    }

    /**
     * @brief Build the engine request for one chunk of a file
     * @param file Path relative to the engine's local root
     * @param offset Offset the caller believes is confirmed
     */
    [[nodiscard]] auto make_request(const std::string& file, uint64_t offset) const
        -> transfer_request {
        transfer_request request;
        request.protocol = to_string(protocol);
        request.host = host;
        request.port = port;
        request.user = user;
        request.credential = credential;
        request.remote_dir = remote_dir;
        request.file = file;
        request.offset = offset;
        request.chunk_size = chunk_size;
        request.max_retries = max_retries;
        return request;
    }
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CLIENT_CONNECTION_PROFILE_H
