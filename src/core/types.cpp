/**
 * @file types.cpp
 * @brief Implementation of core type helpers
 */

#include <kcenon/chunk_upload/core/types.h>

#include <algorithm>
#include <cctype>

namespace kcenon::chunk_upload {

auto parse_protocol(std::string_view name) -> std::optional<transfer_protocol> {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "ftp") {
        return transfer_protocol::ftp;
    }
    if (lowered == "sftp") {
        return transfer_protocol::sftp;
    }
    return std::nullopt;
}

}  // namespace kcenon::chunk_upload
