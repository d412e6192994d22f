/**
 * @file chunk_planner.h
 * @brief Byte-range planning for chunked uploads
 */

#ifndef KCENON_CHUNK_UPLOAD_CORE_CHUNK_PLANNER_H
#define KCENON_CHUNK_UPLOAD_CORE_CHUNK_PLANNER_H

#include <kcenon/chunk_upload/core/types.h>

#include <cstdint>

namespace kcenon::chunk_upload {

/**
 * @brief Default chunk size (8 MiB)
 */
inline constexpr uint64_t default_chunk_size = 8 * 1024 * 1024;

/**
 * @brief Byte range selected for one upload call
 */
struct chunk_plan {
    uint64_t offset = 0;   ///< First byte of the range
    uint64_t length = 0;   ///< Number of bytes in the range
    bool is_final = false; ///< Range reaches the end of the file

    /**
     * @brief One past the last byte of the range
     */
    [[nodiscard]] auto end() const noexcept -> uint64_t { return offset + length; }
};

/**
 * @brief Plan the next chunk of a file
 *
 * Returns the range [offset, min(offset + chunk_size, size)).
 *
 * @param size Total file size in bytes
 * @param chunk_size Maximum bytes per call
 * @param offset Bytes already stored remotely
 * @return Planned range, or invalid_chunk_size when chunk_size is 0,
 *         local_file_empty when size is 0, invalid_offset when offset > size
 */
[[nodiscard]] auto plan_chunk(uint64_t size, uint64_t chunk_size, uint64_t offset)
    -> result<chunk_plan>;

/**
 * @brief Completion percentage in [0, 100]
 *
 * Returns 100 for a zero size, and clamps offsets past the end.
 */
[[nodiscard]] auto completion_percent(uint64_t offset, uint64_t size) noexcept -> double;

/**
 * @brief Number of calls still needed to reach the end of the file
 */
[[nodiscard]] auto remaining_chunks(uint64_t size, uint64_t chunk_size, uint64_t offset) noexcept
    -> uint64_t;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CORE_CHUNK_PLANNER_H
