/**
 * @file remote_path.h
 * @brief Remote naming convention for final and partial files
 */

#ifndef KCENON_CHUNK_UPLOAD_CORE_REMOTE_PATH_H
#define KCENON_CHUNK_UPLOAD_CORE_REMOTE_PATH_H

#include <kcenon/chunk_upload/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Suffix of the temporary file that accumulates chunks
 */
inline constexpr std::string_view partial_suffix = ".part";

/**
 * @brief Remote paths used for one file
 */
struct remote_target {
    std::string final_path;    ///< remote_dir + "/" + relative path
    std::string partial_path;  ///< final_path + ".part"
    std::string directory;     ///< Parent of final_path (empty for the login directory)
};

/**
 * @brief Normalize separators of a remote path
 *
 * Backslashes become '/', and runs of '/' collapse to one. A leading '/'
 * is kept; a trailing '/' is removed unless the path is the root.
 */
[[nodiscard]] auto normalize_remote_path(std::string_view path) -> std::string;

/**
 * @brief Build the final/partial names for a file
 *
 * @param remote_dir Destination base directory (may be empty or "/")
 * @param relative_path File path relative to the local root
 * @return Target paths, or invalid_remote_path when the relative path is
 *         empty or contains a ".." segment
 */
[[nodiscard]] auto make_remote_target(std::string_view remote_dir, std::string_view relative_path)
    -> result<remote_target>;

/**
 * @brief Parent directory of a normalized remote path
 */
[[nodiscard]] auto parent_directory(std::string_view path) -> std::string;

/**
 * @brief Cumulative directory prefixes from the root down
 *
 * "/srv/a/b" yields {"/srv", "/srv/a", "/srv/a/b"};
 * "a/b" yields {"a", "a/b"}.
 */
[[nodiscard]] auto directory_prefixes(std::string_view directory) -> std::vector<std::string>;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CORE_REMOTE_PATH_H
