/**
 * @file file_enumerator.cpp
 * @brief Implementation of local file enumeration
 */

#include <kcenon/chunk_upload/client/file_enumerator.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace kcenon::chunk_upload {

namespace {

auto is_readable(const std::filesystem::path& path) -> bool {
    std::ifstream stream(path, std::ios::binary);
    return stream.is_open();
}

}  // namespace

file_enumerator::file_enumerator(enumeration_options options) : options_(std::move(options)) {}

auto file_enumerator::is_excluded_name(std::string_view name) const -> bool {
    return std::find(options_.excluded_directories.begin(), options_.excluded_directories.end(),
                     name) != options_.excluded_directories.end();
}

auto file_enumerator::is_excluded(std::string_view relative_path) const -> bool {
    std::size_t start = 0;
    while (true) {
        const auto slash = relative_path.find('/', start);
        if (slash == std::string_view::npos) {
            return false;  // remaining text is the file name
        }
        if (is_excluded_name(relative_path.substr(start, slash - start))) {
            return true;
        }
        start = slash + 1;
    }
}

auto file_enumerator::enumerate(const std::filesystem::path& root) const
    -> result<std::vector<std::string>> {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return unexpected(error{error_code::local_file_not_found,
                                "not a directory: " + root.string()});
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return unexpected(error{error_code::local_file_unreadable,
                                "cannot list " + root.string() + ": " + ec.message()});
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            CU_LOG_WARN(log_category::orchestrator, "File enumeration error: " + ec.message());
            break;
        }
        if (files.size() >= options_.max_files) {
            CU_LOG_WARN(log_category::orchestrator,
                        "File limit of " + std::to_string(options_.max_files) + " reached");
            break;
        }

        const auto& entry = *it;
        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_directory(ec)) {
            if (is_excluded_name(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec) || !is_readable(entry.path())) {
            continue;
        }

        auto relative = entry.path().lexically_relative(root).generic_string();
        if (!is_excluded(relative)) {
            files.push_back(std::move(relative));
        }
    }

    std::sort(files.begin(), files.end());
    CU_LOG_DEBUG(log_category::orchestrator,
                 "Enumerated " + std::to_string(files.size()) + " files under " + root.string());
    return files;
}

}  // namespace kcenon::chunk_upload
