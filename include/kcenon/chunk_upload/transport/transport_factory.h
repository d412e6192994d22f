/**
 * @file transport_factory.h
 * @brief Creation of remote transports by protocol
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_FACTORY_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_FACTORY_H

#include <functional>
#include <memory>

#include "transport_config.h"
#include "transport_interface.h"

namespace kcenon::chunk_upload {

/**
 * @brief Factory signature used by the engine to open one transport per call
 *
 * Tests inject their own factory to substitute an in-memory transport.
 */
using transport_factory_fn =
    std::function<result<std::unique_ptr<remote_transport>>(transfer_protocol, const transport_config&)>;

/**
 * @brief Create the backend for a protocol
 * @return Transport, or backend_unavailable when the library was built
 *         without the matching client library
 */
[[nodiscard]] auto create_transport(transfer_protocol protocol, const transport_config& config)
    -> result<std::unique_ptr<remote_transport>>;

/**
 * @brief Check whether a backend was compiled in
 */
[[nodiscard]] auto is_protocol_available(transfer_protocol protocol) noexcept -> bool;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_TRANSPORT_FACTORY_H
