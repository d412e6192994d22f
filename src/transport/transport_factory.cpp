/**
 * @file transport_factory.cpp
 * @brief Backend selection by protocol
 */

#include "kcenon/chunk_upload/transport/transport_factory.h"
#include "kcenon/chunk_upload/config/feature_flags.h"

#if CHUNK_UPLOAD_HAS_FTP
#include "kcenon/chunk_upload/transport/ftp_transport.h"
#endif

#if CHUNK_UPLOAD_HAS_SFTP
#include "kcenon/chunk_upload/transport/sftp_transport.h"
#endif

namespace kcenon::chunk_upload {

auto create_transport(transfer_protocol protocol, const transport_config& config)
    -> result<std::unique_ptr<remote_transport>> {
    switch (protocol) {
        case transfer_protocol::ftp:
#if CHUNK_UPLOAD_HAS_FTP
            return std::unique_ptr<remote_transport>(ftp_transport::create(config));
#else
            break;
#endif
        case transfer_protocol::sftp:
#if CHUNK_UPLOAD_HAS_SFTP
            return std::unique_ptr<remote_transport>(sftp_transport::create(config));
#else
            break;
#endif
    }

    (void)config;
    return unexpected(error{error_code::backend_unavailable,
                            std::string(to_string(protocol)) +
                                " support was not compiled into this build"});
}

auto is_protocol_available(transfer_protocol protocol) noexcept -> bool {
    switch (protocol) {
        case transfer_protocol::ftp:
            return CHUNK_UPLOAD_HAS_FTP != 0;
        case transfer_protocol::sftp:
            return CHUNK_UPLOAD_HAS_SFTP != 0;
    }
    return false;
}

}  // namespace kcenon::chunk_upload
