/**
 * @file credential.cpp
 * @brief Implementation of credential classification
 */

#include <kcenon/chunk_upload/transport/credential.h>

#include <filesystem>
#include <fstream>

namespace kcenon::chunk_upload {

namespace {

auto looks_like_private_key(std::string_view raw) -> bool {
    auto begin = raw.find("-----BEGIN ");
    if (begin == std::string_view::npos) {
        return false;
    }
    auto marker = raw.find("PRIVATE KEY-----", begin);
    return marker != std::string_view::npos;
}

auto is_readable_file(std::string_view raw) -> bool {
    if (raw.empty() || raw.find('\n') != std::string_view::npos) {
        return false;
    }

    std::error_code ec;
    std::filesystem::path path{std::string(raw)};
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }

    std::ifstream stream(path, std::ios::binary);
    return stream.good();
}

}  // namespace

auto classify_credential(std::string_view raw) -> credential {
    credential cred;
    cred.secret = std::string(raw);

    if (looks_like_private_key(raw)) {
        cred.kind = credential_kind::key_content;
    } else if (is_readable_file(raw)) {
        cred.kind = credential_kind::key_file;
    } else {
        cred.kind = credential_kind::password;
    }
    return cred;
}

}  // namespace kcenon::chunk_upload
