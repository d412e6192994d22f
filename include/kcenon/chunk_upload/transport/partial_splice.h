/**
 * @file partial_splice.h
 * @brief Append emulation for servers without offset writes
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_PARTIAL_SPLICE_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_PARTIAL_SPLICE_H

#include <kcenon/chunk_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Build the new partial file contents for a write at @p offset
 *
 * Bytes of @p existing past @p offset are discarded before @p data is
 * appended, so a replayed chunk never duplicates data.
 *
 * @param path Remote path, used in error messages
 * @param existing Downloaded partial file (nullopt when it does not exist)
 * @param offset Byte position the chunk starts at
 * @param data Chunk bytes
 * @return Spliced contents, or remote_size_mismatch when the partial file is
 *         missing or shorter than @p offset
 */
[[nodiscard]] auto splice_partial(std::string_view path,
                                  std::optional<std::vector<std::byte>> existing,
                                  uint64_t offset,
                                  std::span<const std::byte> data)
    -> result<std::vector<std::byte>>;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_PARTIAL_SPLICE_H
