/**
 * @file local_source.h
 * @brief Read access to the local file being uploaded
 */

#ifndef KCENON_CHUNK_UPLOAD_CORE_LOCAL_SOURCE_H
#define KCENON_CHUNK_UPLOAD_CORE_LOCAL_SOURCE_H

#include <kcenon/chunk_upload/core/types.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Local file opened for ranged reads
 *
 * The size is queried once on open. Reads never pad: a range that cannot
 * be read in full is an error.
 */
class local_source {
public:
    /**
     * @brief Open a regular, non-empty file
     * @param path Local file path
     * @return Opened source, or local_file_not_found / local_file_unreadable /
     *         local_file_empty
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path) -> result<local_source>;

    /**
     * @brief Read exactly length bytes starting at offset
     * @return Bytes read, or local_seek_failed / local_short_read
     */
    [[nodiscard]] auto read(uint64_t offset, uint64_t length) -> result<std::vector<std::byte>>;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    local_source(local_source&&) noexcept = default;
    auto operator=(local_source&&) noexcept -> local_source& = default;

    local_source(const local_source&) = delete;
    auto operator=(const local_source&) -> local_source& = delete;

private:
    local_source(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_ = 0;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CORE_LOCAL_SOURCE_H
