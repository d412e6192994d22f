/**
 * @file remote_path.cpp
 * @brief Implementation of remote path helpers
 */

#include <kcenon/chunk_upload/core/remote_path.h>

namespace kcenon::chunk_upload {

auto normalize_remote_path(std::string_view path) -> std::string {
    std::string normalized;
    normalized.reserve(path.size());

    for (char c : path) {
        if (c == '\\') {
            c = '/';
        }
        if (c == '/' && !normalized.empty() && normalized.back() == '/') {
            continue;
        }
        normalized.push_back(c);
    }

    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

auto make_remote_target(std::string_view remote_dir, std::string_view relative_path)
    -> result<remote_target> {
    auto relative = normalize_remote_path(relative_path);
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(relative.begin());
    }

    if (relative.empty()) {
        return unexpected(error{error_code::invalid_remote_path, "relative file path is empty"});
    }

    for (const auto& segment : directory_prefixes(relative)) {
        auto last = segment.find_last_of('/');
        auto name = last == std::string::npos ? segment : segment.substr(last + 1);
        if (name == "..") {
            return unexpected(error{error_code::invalid_remote_path,
                                    "relative file path escapes remote directory: " + relative});
        }
    }

    auto base = normalize_remote_path(remote_dir);
    if (!base.empty() && base.back() == '/') {
        base.pop_back();  // root "/" becomes "" so the join below yields "/file"
    }

    remote_target target;
    if (base.empty() && !remote_dir.empty()) {
        target.final_path = "/" + relative;
    } else if (base.empty()) {
        target.final_path = relative;
    } else {
        target.final_path = base + "/" + relative;
    }
    target.partial_path = target.final_path + std::string(partial_suffix);
    target.directory = parent_directory(target.final_path);
    return target;
}

auto parent_directory(std::string_view path) -> std::string {
    auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) {
        return {};
    }
    if (pos == 0) {
        return "/";
    }
    return std::string(path.substr(0, pos));
}

auto directory_prefixes(std::string_view directory) -> std::vector<std::string> {
    std::vector<std::string> prefixes;
    auto normalized = normalize_remote_path(directory);
    if (normalized.empty() || normalized == "/") {
        return prefixes;
    }

    std::string current;
    std::size_t pos = 0;
    if (normalized.front() == '/') {
        current = "/";
        pos = 1;
    }

    while (pos < normalized.size()) {
        auto next = normalized.find('/', pos);
        auto segment = normalized.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (!current.empty() && current.back() != '/') {
            current += '/';
        }
        current += segment;
        prefixes.push_back(current);
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return prefixes;
}

}  // namespace kcenon::chunk_upload
