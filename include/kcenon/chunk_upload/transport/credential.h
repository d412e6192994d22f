/**
 * @file credential.h
 * @brief Credential classification for remote authentication
 */

#ifndef KCENON_CHUNK_UPLOAD_TRANSPORT_CREDENTIAL_H
#define KCENON_CHUNK_UPLOAD_TRANSPORT_CREDENTIAL_H

#include <string>
#include <string_view>

namespace kcenon::chunk_upload {

/**
 * @brief What a credential string holds
 */
enum class credential_kind {
    password,     ///< Plain password
    key_content,  ///< PEM or OpenSSH private key text
    key_file      ///< Path to a readable private key file
};

/**
 * @brief Convert credential_kind to string
 */
[[nodiscard]] constexpr auto to_string(credential_kind kind) -> const char* {
    switch (kind) {
        case credential_kind::password: return "password";
        case credential_kind::key_content: return "key_content";
        case credential_kind::key_file: return "key_file";
        default: return "unknown";
    }
}

/**
 * @brief Classified credential
 *
 * The secret is never written to logs.
 */
struct credential {
    credential_kind kind = credential_kind::password;
    std::string secret;

    [[nodiscard]] auto is_key() const noexcept -> bool {
        return kind != credential_kind::password;
    }
};

/**
 * @brief Classify a raw credential string
 *
 * Private key text ("-----BEGIN ... PRIVATE KEY-----") is key_content; a
 * path to an existing readable regular file is key_file; anything else is
 * a password.
 */
[[nodiscard]] auto classify_credential(std::string_view raw) -> credential;

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_TRANSPORT_CREDENTIAL_H
