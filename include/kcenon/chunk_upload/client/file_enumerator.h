/**
 * @file file_enumerator.h
 * @brief Listing of uploadable files under a local root
 */

#ifndef KCENON_CHUNK_UPLOAD_CLIENT_FILE_ENUMERATOR_H
#define KCENON_CHUNK_UPLOAD_CLIENT_FILE_ENUMERATOR_H

#include <kcenon/chunk_upload/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Options for file enumeration
 */
struct enumeration_options {
    /// Directory names whose contents are never listed
    std::vector<std::string> excluded_directories{
        ".git", "node_modules", ".idea", ".DS_Store", "cache", "tmp"};

    /// Maximum number of files returned
    std::size_t max_files = 50000;
};

/**
 * @brief Lists regular, readable, non-symlink files below a root
 *
 * Paths are returned relative to the root with '/' separators, sorted, and
 * ready to be passed as transfer_request::file.
 */
class file_enumerator {
public:
    explicit file_enumerator(enumeration_options options = {});

    /**
     * @brief Enumerate files below root
     * @return Relative paths, or local_file_not_found when root is not a directory
     */
    [[nodiscard]] auto enumerate(const std::filesystem::path& root) const
        -> result<std::vector<std::string>>;

    /**
     * @brief Check whether a relative path lies inside an excluded directory
     *
     * Only directory components are compared; the file name itself is not.
     */
    [[nodiscard]] auto is_excluded(std::string_view relative_path) const -> bool;

    [[nodiscard]] auto options() const -> const enumeration_options& { return options_; }

private:
    [[nodiscard]] auto is_excluded_name(std::string_view name) const -> bool;

    enumeration_options options_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CLIENT_FILE_ENUMERATOR_H
