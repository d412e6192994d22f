/**
 * @file chunk_upload.h
 * @brief Main header for chunk_upload_system library
 * @version 0.1.0
 *
 * Primary include file for the resumable FTP/SFTP chunk upload library.
 *
 * @code
 * #include <kcenon/chunk_upload/chunk_upload.h>
 *
 * using namespace kcenon::chunk_upload;
 *
 * auto engine = upload_engine::builder()
 *     .with_local_root("/var/www/site")
 *     .build();
 *
 * connection_profile profile;
 * profile.protocol = transfer_protocol::sftp;
 * profile.host = "backup.example.com";
 * profile.user = "deploy";
 * profile.credential = "/home/deploy/.ssh/id_ed25519";
 * profile.remote_dir = "/srv/backups";
 *
 * upload_orchestrator orchestrator(engine.value(), profile);
 * auto summary = orchestrator.run({"backups/site.tar.gz"});
 * @endcode
 */

#ifndef KCENON_CHUNK_UPLOAD_CHUNK_UPLOAD_H
#define KCENON_CHUNK_UPLOAD_CHUNK_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/chunk_upload/core/types.h"
#include "kcenon/chunk_upload/core/error_codes.h"
#include "kcenon/chunk_upload/core/chunk_planner.h"
#include "kcenon/chunk_upload/core/remote_path.h"

// Transport
#include "kcenon/chunk_upload/transport/transport_factory.h"

// Session
#include "kcenon/chunk_upload/session/transfer_types.h"
#include "kcenon/chunk_upload/session/upload_engine.h"

// Client
#include "kcenon/chunk_upload/client/connection_profile.h"
#include "kcenon/chunk_upload/client/file_enumerator.h"
#include "kcenon/chunk_upload/client/upload_orchestrator.h"

namespace kcenon::chunk_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CHUNK_UPLOAD_H
