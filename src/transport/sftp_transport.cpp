/**
 * @file sftp_transport.cpp
 * @brief SFTP transport implementation (libssh2)
 */

#include "kcenon/chunk_upload/transport/sftp_transport.h"
#include "kcenon/chunk_upload/core/error_codes.h"
#include "kcenon/chunk_upload/core/logging.h"
#include "kcenon/chunk_upload/core/remote_path.h"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <vector>

namespace kcenon::chunk_upload {

namespace {

auto ensure_libssh2_initialized() -> bool {
    static std::once_flag init_flag;
    static int init_code = 0;
    std::call_once(init_flag, [] { init_code = libssh2_init(0); });
    return init_code == 0;
}

auto to_hex(const unsigned char* data, std::size_t size) -> std::string {
    std::string hex;
    hex.reserve(size * 3);
    char buf[4];
    for (std::size_t i = 0; i < size; ++i) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : ":%02x", data[i]);
        hex += buf;
    }
    return hex;
}

auto known_host_key_type(int hostkey_type) -> int {
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

}  // namespace

struct sftp_transport::impl {
    transport_config config;

    int sock = -1;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;

    std::optional<endpoint> remote;
    std::string user;
    credential cred;
    bool authenticated = false;
    bool connected = false;
    std::string identification;

    explicit impl(transport_config cfg) : config(std::move(cfg)) {}

    void teardown() {
        if (sftp) {
            libssh2_sftp_shutdown(sftp);
            sftp = nullptr;
        }
        if (session) {
            libssh2_session_disconnect(session, "bye");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != -1) {
            ::close(sock);
            sock = -1;
        }
        authenticated = false;
        connected = false;
    }

    [[nodiscard]] auto last_session_message() const -> std::string {
        if (!session) {
            return "no session";
        }
        char* message = nullptr;
        int length = 0;
        libssh2_session_last_error(session, &message, &length, 0);
        return message ? std::string(message, static_cast<std::size_t>(length)) : std::string{};
    }

    /**
     * @brief Classify the most recent libssh2 failure
     */
    [[nodiscard]] auto classify_last_error() -> error_code {
        if (!session) {
            return error_code::not_connected;
        }

        const int session_errno = libssh2_session_last_errno(session);
        switch (session_errno) {
            case LIBSSH2_ERROR_TIMEOUT:
                connected = false;
                return error_code::operation_timeout;
            case LIBSSH2_ERROR_SOCKET_SEND:
            case LIBSSH2_ERROR_SOCKET_RECV:
            case LIBSSH2_ERROR_SOCKET_DISCONNECT:
            case LIBSSH2_ERROR_CHANNEL_CLOSED:
            case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
                connected = false;
                return error_code::connection_lost;
            case LIBSSH2_ERROR_SFTP_PROTOCOL:
                break;
            default:
                return error_code::remote_io_error;
        }

        const unsigned long sftp_errno = sftp ? libssh2_sftp_last_error(sftp) : 0;
        switch (sftp_errno) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return error_code::remote_not_found;
            case LIBSSH2_FX_NO_CONNECTION:
            case LIBSSH2_FX_CONNECTION_LOST:
                connected = false;
                return error_code::connection_lost;
            case LIBSSH2_FX_LOCK_CONFLICT:
                return error_code::remote_busy;
            default:
                return error_code::remote_io_error;
        }
    }

    [[nodiscard]] auto failure(const std::string& operation, const std::string& target)
        -> error {
        auto code = classify_last_error();
        auto message = "SFTP " + operation + " failed for " + target + ": " + last_session_message();
        CU_LOG_DEBUG(log_category::transport, message);
        return error{code, message};
    }

    [[nodiscard]] auto require_connection() const -> result<void> {
        if (!session || !sftp || !authenticated || !connected) {
            return unexpected(error{error_code::not_connected, "SFTP transport is not connected"});
        }
        return {};
    }

    [[nodiscard]] auto tcp_connect(const endpoint& target) -> result<void> {
        struct addrinfo hints {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        const std::string port = std::to_string(target.port);
        struct addrinfo* addresses = nullptr;
        const int gai = ::getaddrinfo(target.host.c_str(), port.c_str(), &hints, &addresses);
        if (gai != 0) {
            return unexpected(error{error_code::connection_failed,
                                    "cannot resolve " + target.host + ": " + ::gai_strerror(gai)});
        }

        error_code last_code = error_code::connection_failed;
        std::string last_message = "no address for " + target.to_string();

        for (auto* candidate = addresses; candidate != nullptr; candidate = candidate->ai_next) {
            int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
            if (fd == -1) {
                continue;
            }

            if (config.keep_alive) {
                int enable = 1;
                ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable));
#if defined(__linux__)
                int idle = static_cast<int>(config.keep_alive_interval.count());
                ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
                ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &idle, sizeof(idle));
#endif
            }

            // Non-blocking connect bounded by the connect timeout
            const int flags = ::fcntl(fd, F_GETFL, 0);
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, candidate->ai_addr, candidate->ai_addrlen);
            if (rc != 0 && errno == EINPROGRESS) {
                struct pollfd pfd {};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                rc = ::poll(&pfd, 1, static_cast<int>(config.connect_timeout.count()));
                if (rc == 0) {
                    last_code = error_code::connection_timeout;
                    last_message = "connect to " + target.to_string() + " timed out";
                    ::close(fd);
                    continue;
                }
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                rc = (rc > 0 && so_error == 0) ? 0 : -1;
                if (rc != 0) {
                    errno = so_error;
                }
            }

            if (rc == 0) {
                ::fcntl(fd, F_SETFL, flags);
                sock = fd;
                ::freeaddrinfo(addresses);
                return {};
            }

            last_code = error_code::connection_failed;
            last_message = "connect to " + target.to_string() + " failed: " + std::strerror(errno);
            ::close(fd);
        }

        ::freeaddrinfo(addresses);
        return unexpected(error{last_code, last_message});
    }

    [[nodiscard]] auto verify_host_key(const endpoint& target) -> result<void> {
        std::size_t key_length = 0;
        int key_type = 0;
        const char* host_key = libssh2_session_hostkey(session, &key_length, &key_type);
        if (!host_key || key_length == 0) {
            return unexpected(error{error_code::connection_failed, "server sent no host key"});
        }

#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
        const auto* hash = reinterpret_cast<const unsigned char*>(
            libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (hash) {
            CU_LOG_DEBUG(log_category::transport,
                "SFTP host key for " + target.to_string() + " (SHA256) " + to_hex(hash, 32));
        }
#endif

        if (config.sftp_host_key_policy == host_key_policy::accept_any) {
            return {};
        }

        if (!config.known_hosts_path) {
            return unexpected(error{error_code::credential_rejected,
                                    "known_hosts policy requires known_hosts_path"});
        }

        LIBSSH2_KNOWNHOSTS* known_hosts = libssh2_knownhost_init(session);
        if (!known_hosts) {
            return unexpected(error{error_code::internal_error, "libssh2_knownhost_init failed"});
        }

        if (libssh2_knownhost_readfile(known_hosts, config.known_hosts_path->c_str(),
                                       LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
            libssh2_knownhost_free(known_hosts);
            return unexpected(error{error_code::credential_rejected,
                                    "cannot read known_hosts file " + *config.known_hosts_path});
        }

        struct libssh2_knownhost* entry = nullptr;
        const int check = libssh2_knownhost_checkp(
            known_hosts, target.host.c_str(), target.port, host_key, key_length,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                known_host_key_type(key_type),
            &entry);
        libssh2_knownhost_free(known_hosts);

        if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
            return {};
        }
        if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
            return unexpected(error{error_code::credential_rejected,
                                    "host key mismatch for " + target.to_string()});
        }
        return unexpected(error{error_code::credential_rejected,
                                "host " + target.to_string() + " not found in known_hosts"});
    }

    [[nodiscard]] auto map_auth_failure(int rc, bool key_auth) -> error_code {
        switch (rc) {
            case LIBSSH2_ERROR_FILE:
                return error_code::key_load_failed;
            case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
                return key_auth ? error_code::key_load_failed : error_code::credential_rejected;
            case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
            case LIBSSH2_ERROR_PASSWORD_EXPIRED:
            case LIBSSH2_ERROR_PUBLICKEY_PROTOCOL:
                return error_code::credential_rejected;
            case LIBSSH2_ERROR_SOCKET_SEND:
            case LIBSSH2_ERROR_SOCKET_RECV:
            case LIBSSH2_ERROR_SOCKET_DISCONNECT:
            case LIBSSH2_ERROR_TIMEOUT:
                connected = false;
                return error_code::authentication_failed;
            default:
                return error_code::authentication_failed;
        }
    }

    [[nodiscard]] auto is_directory(const std::string& path) -> bool {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        if (libssh2_sftp_stat_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                 LIBSSH2_SFTP_STAT, &attrs) != 0) {
            return false;
        }
        if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0) {
            return true;
        }
        return (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
};

sftp_transport::sftp_transport(transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
}

sftp_transport::~sftp_transport() {
    if (impl_) {
        impl_->teardown();
    }
}

auto sftp_transport::create(const transport_config& config) -> std::unique_ptr<sftp_transport> {
    return std::unique_ptr<sftp_transport>(new sftp_transport(config));
}

auto sftp_transport::protocol() const -> transfer_protocol {
    return transfer_protocol::sftp;
}

auto sftp_transport::connect(const endpoint& remote) -> result<void> {
    if (!ensure_libssh2_initialized()) {
        return unexpected(error{error_code::internal_error, "libssh2_init failed"});
    }

    impl_->teardown();
    impl_->remote = remote;

    if (auto tcp = impl_->tcp_connect(remote); !tcp) {
        CU_LOG_WARN(log_category::transport, tcp.error().message);
        return tcp;
    }

    impl_->session = libssh2_session_init();
    if (!impl_->session) {
        impl_->teardown();
        return unexpected(error{error_code::internal_error, "libssh2_session_init failed"});
    }

    libssh2_session_set_blocking(impl_->session, 1);
    if (impl_->config.operation_timeout.count() > 0) {
        libssh2_session_set_timeout(impl_->session,
                                    static_cast<long>(impl_->config.operation_timeout.count()));
    }

    if (libssh2_session_handshake(impl_->session, impl_->sock) != 0) {
        auto message = "SSH handshake with " + remote.to_string() + " failed: " +
                       impl_->last_session_message();
        impl_->teardown();
        return unexpected(error{error_code::connection_failed, message});
    }

    if (impl_->config.keep_alive) {
        libssh2_keepalive_config(impl_->session, 1,
                                 static_cast<unsigned int>(impl_->config.keep_alive_interval.count()));
    }

    if (auto verified = impl_->verify_host_key(remote); !verified) {
        impl_->teardown();
        return verified;
    }

    const char* banner = libssh2_session_banner_get(impl_->session);
    impl_->identification = banner ? banner : "SSH server at " + remote.to_string();

    CU_LOG_DEBUG(log_category::transport,
        "SFTP handshake completed with " + remote.to_string() + " (" + impl_->identification + ")");
    return {};
}

auto sftp_transport::authenticate(const std::string& user, const credential& cred) -> result<void> {
    if (!impl_->session) {
        return unexpected(error{error_code::not_connected, "connect() must precede authenticate()"});
    }

    impl_->user = user;
    impl_->cred = cred;
    impl_->connected = true;

    int rc = 0;
    switch (cred.kind) {
        case credential_kind::key_content:
            rc = libssh2_userauth_publickey_frommemory(
                impl_->session, user.c_str(), user.size(), nullptr, 0,
                cred.secret.c_str(), cred.secret.size(), nullptr);
            break;
        case credential_kind::key_file:
            rc = libssh2_userauth_publickey_fromfile(
                impl_->session, user.c_str(), nullptr, cred.secret.c_str(), nullptr);
            break;
        case credential_kind::password:
            rc = libssh2_userauth_password(impl_->session, user.c_str(), cred.secret.c_str());
            break;
    }

    if (rc != 0) {
        auto code = impl_->map_auth_failure(rc, cred.is_key());
        auto message = std::string("SFTP ") + to_string(cred.kind) + " authentication failed for user " +
                       user + ": " + impl_->last_session_message();
        CU_LOG_WARN(log_category::transport, message);
        impl_->teardown();
        return unexpected(error{code, message});
    }

    impl_->sftp = libssh2_sftp_init(impl_->session);
    if (!impl_->sftp) {
        auto message = "SFTP subsystem unavailable: " + impl_->last_session_message();
        impl_->teardown();
        return unexpected(error{error_code::connection_failed, message});
    }

    impl_->authenticated = true;
    CU_LOG_INFO(log_category::transport,
        "SFTP login succeeded on " + impl_->remote->to_string());
    return {};
}

auto sftp_transport::is_connected() const -> bool {
    if (!impl_->session || !impl_->sftp || !impl_->authenticated || !impl_->connected) {
        return false;
    }

    int next_seconds = 0;
    if (libssh2_keepalive_send(impl_->session, &next_seconds) != 0) {
        impl_->connected = false;
        return false;
    }
    return true;
}

auto sftp_transport::reconnect() -> result<void> {
    if (!impl_->remote) {
        return unexpected(error{error_code::not_connected, "no endpoint to reconnect to"});
    }

    CU_LOG_INFO(log_category::transport, "SFTP reconnecting to " + impl_->remote->to_string());

    auto remote = *impl_->remote;
    auto user = impl_->user;
    auto cred = impl_->cred;

    if (auto connected = connect(remote); !connected) {
        return connected;
    }
    return authenticate(user, cred);
}

void sftp_transport::close() {
    impl_->teardown();
}

auto sftp_transport::server_identification() const -> std::string {
    return impl_->identification;
}

auto sftp_transport::ensure_remote_directory(const std::string& path) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    auto prefixes = directory_prefixes(path);
    if (prefixes.empty()) {
        return {};
    }

    std::vector<std::string> failed;
    for (const auto& prefix : prefixes) {
        if (impl_->is_directory(prefix)) {
            continue;
        }
        const int rc = libssh2_sftp_mkdir_ex(impl_->sftp, prefix.c_str(),
                                             static_cast<unsigned int>(prefix.size()), 0755);
        if (rc != 0) {
            auto err = impl_->failure("mkdir", prefix);
            if (is_connection_error(err.code)) {
                return unexpected(err);
            }
            failed.push_back(prefix);
        }
    }

    if (!impl_->is_directory(prefixes.back())) {
        return unexpected(error{error_code::directory_create_failed,
                                "cannot create remote directory " + prefixes.back()});
    }

    for (const auto& segment : failed) {
        CU_LOG_DEBUG(log_category::transport, "SFTP mkdir " + segment + " failed (tolerated)");
    }
    return {};
}

auto sftp_transport::write_chunk(const std::string& path,
                                 uint64_t offset,
                                 std::span<const std::byte> data,
                                 write_mode mode) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    if (mode == write_mode::create) {
        flags |= LIBSSH2_FXF_TRUNC;
    }

    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open_ex(
        impl_->sftp, path.c_str(), static_cast<unsigned int>(path.size()),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!handle) {
        return unexpected(impl_->failure("open", path));
    }

    if (mode == write_mode::append && offset > 0) {
        libssh2_sftp_seek64(handle, static_cast<libssh2_uint64_t>(offset));
    }

    const char* cursor = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = libssh2_sftp_write(handle, cursor, remaining);
        if (written < 0) {
            auto err = impl_->failure("write", path);
            libssh2_sftp_close(handle);
            return unexpected(err);
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (libssh2_sftp_close(handle) != 0) {
        return unexpected(impl_->failure("close", path));
    }
    return {};
}

auto sftp_transport::remote_size(const std::string& path) -> result<std::optional<uint64_t>> {
    if (auto ready = impl_->require_connection(); !ready) {
        return unexpected(ready.error());
    }

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    const int rc = libssh2_sftp_stat_ex(impl_->sftp, path.c_str(),
                                        static_cast<unsigned int>(path.size()),
                                        LIBSSH2_SFTP_STAT, &attrs);
    if (rc != 0) {
        auto err = impl_->failure("stat", path);
        if (err.code == error_code::remote_not_found) {
            return std::optional<uint64_t>{};
        }
        return unexpected(err);
    }

    if ((attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0) {
        return unexpected(error{error_code::remote_io_error,
                                "SFTP server did not report a size for " + path});
    }
    return std::optional<uint64_t>{static_cast<uint64_t>(attrs.filesize)};
}

auto sftp_transport::rename(const std::string& from, const std::string& to) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    const int rc = libssh2_sftp_rename_ex(
        impl_->sftp,
        from.c_str(), static_cast<unsigned int>(from.size()),
        to.c_str(), static_cast<unsigned int>(to.size()),
        LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    if (rc == 0) {
        return {};
    }

    auto err = impl_->failure("rename", from);
    if (err.code == error_code::remote_not_found) {
        return unexpected(error{error_code::partial_file_missing,
                                "rename source does not exist: " + from});
    }
    if (is_connection_error(err.code)) {
        return unexpected(err);
    }
    return unexpected(error{error_code::rename_failed, err.message});
}

auto sftp_transport::remove(const std::string& path) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    const int rc = libssh2_sftp_unlink_ex(impl_->sftp, path.c_str(),
                                          static_cast<unsigned int>(path.size()));
    if (rc == 0) {
        return {};
    }

    auto err = impl_->failure("unlink", path);
    if (err.code == error_code::remote_not_found) {
        return {};
    }
    return unexpected(err);
}

auto sftp_transport::preferred_sub_write_size() const -> std::optional<std::size_t> {
    if (impl_->config.sub_write_size == 0) {
        return std::nullopt;
    }
    return impl_->config.sub_write_size;
}

}  // namespace kcenon::chunk_upload
