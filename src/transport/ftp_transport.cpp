/**
 * @file ftp_transport.cpp
 * @brief FTP transport implementation (libcurl)
 */

#include "kcenon/chunk_upload/transport/ftp_transport.h"
#include "kcenon/chunk_upload/core/error_codes.h"
#include "kcenon/chunk_upload/core/logging.h"
#include "kcenon/chunk_upload/core/remote_path.h"
#include "kcenon/chunk_upload/transport/partial_splice.h"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::chunk_upload {

namespace {

struct curl_easy_deleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};
using unique_curl_easy = std::unique_ptr<CURL, curl_easy_deleter>;

struct curl_slist_deleter {
    void operator()(curl_slist* list) const noexcept {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};
using unique_curl_slist = std::unique_ptr<curl_slist, curl_slist_deleter>;

auto ensure_curl_initialized() -> bool {
    static std::once_flag init_flag;
    static CURLcode init_code = CURLE_OK;
    std::call_once(init_flag, [] { init_code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return init_code == CURLE_OK;
}

auto map_curl_error(CURLcode code, long response_code) -> error_code {
    if (response_code == 421 || response_code == 450) {
        return error_code::remote_busy;
    }

    switch (code) {
        case CURLE_LOGIN_DENIED:
            return error_code::credential_rejected;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
            return error_code::connection_failed;
        case CURLE_OPERATION_TIMEDOUT:
            return error_code::operation_timeout;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_FTP_ACCEPT_FAILED:
            return error_code::connection_lost;
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_FTP_COULDNT_RETR_FILE:
            return error_code::remote_not_found;
        default:
            return error_code::remote_io_error;
    }
}

struct upload_source {
    std::span<const std::byte> data;
    std::size_t position = 0;
};

auto read_from_buffer(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* source = static_cast<upload_source*>(userdata);
    const size_t capacity = size * nitems;
    const size_t remaining = source->data.size() - source->position;
    const size_t count = std::min(capacity, remaining);
    if (count > 0) {
        std::memcpy(buffer, source->data.data() + source->position, count);
        source->position += count;
    }
    return count;
}

auto write_to_vector(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* sink = static_cast<std::vector<std::byte>*>(userdata);
    const size_t count = size * nmemb;
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    sink->insert(sink->end(), bytes, bytes + count);
    return count;
}

auto capture_banner(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* banner = static_cast<std::string*>(userdata);
    const size_t count = size * nitems;
    if (banner->empty() && count >= 3 && std::strncmp(buffer, "220", 3) == 0) {
        std::string line(buffer, count);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        *banner = line;
    }
    return count;
}

}  // namespace

struct ftp_transport::impl {
    transport_config config;
    unique_curl_easy handle;

    std::optional<endpoint> remote;
    std::string user;
    credential cred;
    bool authenticated = false;
    bool connected = false;
    std::string banner;
    char error_buffer[CURL_ERROR_SIZE]{};

    explicit impl(transport_config cfg) : config(std::move(cfg)) {}

    [[nodiscard]] auto base_url() const -> std::string {
        std::string host = remote ? remote->host : std::string{};
        if (host.find(':') != std::string::npos && host.front() != '[') {
            host = "[" + host + "]";
        }
        return "ftp://" + host + ":" + std::to_string(remote ? remote->port : 21);
    }

    [[nodiscard]] auto escape_path(const std::string& path) const -> std::string {
        std::string escaped;
        std::size_t pos = 0;
        while (pos <= path.size()) {
            auto next = path.find('/', pos);
            auto segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
            char* encoded = curl_easy_escape(handle.get(), segment.c_str(),
                                             static_cast<int>(segment.size()));
            if (encoded) {
                escaped += encoded;
                curl_free(encoded);
            }
            if (next == std::string::npos) {
                break;
            }
            escaped += '/';
            pos = next + 1;
        }
        return escaped;
    }

    [[nodiscard]] auto url_for(const std::string& path, bool directory = false) const -> std::string {
        std::string url = base_url();
        if (path.empty() || path == "/") {
            return url + (path == "/" ? "/%2F/" : "/");
        }
        if (path.front() == '/') {
            url += "/%2F" + escape_path(path.substr(1));
        } else {
            url += "/" + escape_path(path);
        }
        if (directory && url.back() != '/') {
            url += '/';
        }
        return url;
    }

    void prepare(const std::string& url) {
        CURL* curl = handle.get();
        curl_easy_reset(curl);
        error_buffer[0] = '\0';

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config.connect_timeout.count()));

        if (config.operation_timeout.count() > 0) {
            const long seconds = std::max<long>(
                1, static_cast<long>(config.operation_timeout.count() / 1000));
            curl_easy_setopt(curl, CURLOPT_SERVER_RESPONSE_TIMEOUT, seconds);
            // Abort a stalled data connection after the same interval
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, seconds);
        }

        if (config.keep_alive) {
            const long interval = static_cast<long>(config.keep_alive_interval.count());
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, interval);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, interval);
        }

        if (!config.ftp_passive) {
            curl_easy_setopt(curl, CURLOPT_FTPPORT, "-");
        }

        curl_easy_setopt(curl, CURLOPT_USERNAME, user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, cred.secret.c_str());

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, capture_banner);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &banner);
    }

    [[nodiscard]] auto perform(const std::string& operation, const std::string& target)
        -> result<void> {
        const CURLcode code = curl_easy_perform(handle.get());
        if (code == CURLE_OK) {
            return {};
        }

        long response_code = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response_code);

        auto mapped = map_curl_error(code, response_code);
        if (is_connection_error(mapped)) {
            connected = false;
        }

        std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                     : std::string(curl_easy_strerror(code));
        CU_LOG_DEBUG(log_category::transport,
            "FTP " + operation + " failed for " + target + ": " + detail +
            " (response " + std::to_string(response_code) + ")");

        return unexpected(error{mapped, "FTP " + operation + " failed: " + detail});
    }

    [[nodiscard]] auto quote(const std::vector<std::string>& commands, const std::string& target)
        -> result<void> {
        unique_curl_slist list;
        for (const auto& command : commands) {
            curl_slist* appended = curl_slist_append(list.get(), command.c_str());
            if (!appended) {
                return unexpected(error{error_code::internal_error, "out of memory building FTP command"});
            }
            (void)list.release();
            list.reset(appended);
        }

        prepare(url_for("", true));
        curl_easy_setopt(handle.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_QUOTE, list.get());
        return perform(commands.front().substr(0, commands.front().find(' ')), target);
    }

    [[nodiscard]] auto download(const std::string& path) -> result<std::vector<std::byte>> {
        std::vector<std::byte> content;
        prepare(url_for(path));
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_vector);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &content);
        if (auto performed = perform("download", path); !performed) {
            return unexpected(performed.error());
        }
        return content;
    }

    [[nodiscard]] auto upload(const std::string& path, std::span<const std::byte> data)
        -> result<void> {
        upload_source source{data, 0};
        prepare(url_for(path));
        curl_easy_setopt(handle.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_READFUNCTION, read_from_buffer);
        curl_easy_setopt(handle.get(), CURLOPT_READDATA, &source);
        curl_easy_setopt(handle.get(), CURLOPT_INFILESIZE_LARGE,
                         static_cast<curl_off_t>(data.size()));
        return perform("upload", path);
    }

    [[nodiscard]] auto size_of(const std::string& path) -> result<std::optional<uint64_t>> {
        prepare(url_for(path));
        curl_easy_setopt(handle.get(), CURLOPT_NOBODY, 1L);
        auto performed = perform("size", path);
        if (!performed) {
            if (performed.error().code == error_code::remote_not_found) {
                return std::optional<uint64_t>{};
            }
            return unexpected(performed.error());
        }

        curl_off_t length = -1;
        curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length < 0) {
            return unexpected(error{error_code::remote_io_error,
                                    "FTP server did not report a size for " + path});
        }
        return std::optional<uint64_t>{static_cast<uint64_t>(length)};
    }

    [[nodiscard]] auto require_connection() const -> result<void> {
        if (!handle || !authenticated || !connected) {
            return unexpected(error{error_code::not_connected, "FTP transport is not connected"});
        }
        return {};
    }
};

ftp_transport::ftp_transport(transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
}

ftp_transport::~ftp_transport() {
    if (impl_) {
        close();
    }
}

auto ftp_transport::create(const transport_config& config) -> std::unique_ptr<ftp_transport> {
    return std::unique_ptr<ftp_transport>(new ftp_transport(config));
}

auto ftp_transport::protocol() const -> transfer_protocol {
    return transfer_protocol::ftp;
}

auto ftp_transport::connect(const endpoint& remote) -> result<void> {
    if (!ensure_curl_initialized()) {
        return unexpected(error{error_code::internal_error, "curl_global_init failed"});
    }

    if (!impl_->handle) {
        impl_->handle.reset(curl_easy_init());
        if (!impl_->handle) {
            return unexpected(error{error_code::internal_error, "curl_easy_init failed"});
        }
    }

    impl_->remote = remote;
    impl_->authenticated = false;
    impl_->connected = false;

    CU_LOG_DEBUG(log_category::transport, "FTP transport prepared for " + remote.to_string());
    return {};
}

auto ftp_transport::authenticate(const std::string& user, const credential& cred) -> result<void> {
    if (!impl_->handle || !impl_->remote) {
        return unexpected(error{error_code::not_connected, "connect() must precede authenticate()"});
    }

    impl_->user = user;
    impl_->cred = cred;
    impl_->banner.clear();

    // Login happens on the first request; a NOBODY request on the login
    // directory performs USER/PASS and keeps the control connection open.
    impl_->connected = true;
    impl_->prepare(impl_->url_for("", true));
    curl_easy_setopt(impl_->handle.get(), CURLOPT_NOBODY, 1L);
    auto performed = impl_->perform("login", impl_->remote->to_string());
    if (!performed) {
        impl_->connected = false;
        auto code = performed.error().code;
        if (code == error_code::credential_rejected) {
            return unexpected(error{code, "FTP login rejected for user " + user});
        }
        if (code == error_code::remote_io_error || code == error_code::remote_not_found) {
            return unexpected(error{error_code::authentication_failed, performed.error().message});
        }
        return performed;
    }

    impl_->authenticated = true;
    CU_LOG_INFO(log_category::transport,
        "FTP login succeeded on " + impl_->remote->to_string());
    return {};
}

auto ftp_transport::is_connected() const -> bool {
    return impl_->handle && impl_->authenticated && impl_->connected;
}

auto ftp_transport::reconnect() -> result<void> {
    if (!impl_->remote) {
        return unexpected(error{error_code::not_connected, "no endpoint to reconnect to"});
    }

    CU_LOG_INFO(log_category::transport, "FTP reconnecting to " + impl_->remote->to_string());

    auto remote = *impl_->remote;
    auto user = impl_->user;
    auto cred = impl_->cred;

    close();
    if (auto connected = connect(remote); !connected) {
        return connected;
    }
    return authenticate(user, cred);
}

void ftp_transport::close() {
    // Cleaning up the easy handle closes the cached control connection
    impl_->handle.reset();
    impl_->authenticated = false;
    impl_->connected = false;
}

auto ftp_transport::server_identification() const -> std::string {
    if (!impl_->banner.empty()) {
        return impl_->banner;
    }
    return impl_->remote ? "FTP server at " + impl_->remote->to_string() : std::string{};
}

auto ftp_transport::ensure_remote_directory(const std::string& path) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    auto prefixes = directory_prefixes(path);
    if (prefixes.empty()) {
        return {};
    }

    std::vector<std::string> failed;
    for (const auto& prefix : prefixes) {
        auto created = impl_->quote({"MKD " + prefix}, prefix);
        if (!created) {
            if (is_connection_error(created.error().code)) {
                return created;
            }
            // Usually "already exists"; verified below
            failed.push_back(prefix);
        }
    }

    impl_->prepare(impl_->url_for(prefixes.back(), true));
    curl_easy_setopt(impl_->handle.get(), CURLOPT_NOBODY, 1L);
    auto verified = impl_->perform("change directory", prefixes.back());
    if (!verified) {
        if (is_connection_error(verified.error().code)) {
            return verified;
        }
        return unexpected(error{error_code::directory_create_failed,
                                "cannot create remote directory " + prefixes.back()});
    }

    for (const auto& segment : failed) {
        CU_LOG_DEBUG(log_category::transport, "FTP MKD " + segment + " failed (tolerated)");
    }
    return {};
}

auto ftp_transport::write_chunk(const std::string& path,
                                uint64_t offset,
                                std::span<const std::byte> data,
                                write_mode mode) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    if (mode == write_mode::create || offset == 0) {
        return impl_->upload(path, data);
    }

    auto existing = impl_->download(path);
    std::optional<std::vector<std::byte>> current;
    if (existing) {
        current = std::move(existing.value());
    } else if (existing.error().code != error_code::remote_not_found) {
        return unexpected(existing.error());
    }

    auto spliced = splice_partial(path, std::move(current), offset, data);
    if (!spliced) {
        return unexpected(spliced.error());
    }
    return impl_->upload(path, spliced.value());
}

auto ftp_transport::remote_size(const std::string& path) -> result<std::optional<uint64_t>> {
    if (auto ready = impl_->require_connection(); !ready) {
        return unexpected(ready.error());
    }
    return impl_->size_of(path);
}

auto ftp_transport::rename(const std::string& from, const std::string& to) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    auto renamed = impl_->quote({"RNFR " + from, "RNTO " + to}, from);
    if (renamed) {
        return {};
    }
    if (is_connection_error(renamed.error().code)) {
        return renamed;
    }

    auto source = impl_->size_of(from);
    if (source && !source.value().has_value()) {
        return unexpected(error{error_code::partial_file_missing,
                                "rename source does not exist: " + from});
    }
    return unexpected(error{error_code::rename_failed, renamed.error().message});
}

auto ftp_transport::remove(const std::string& path) -> result<void> {
    if (auto ready = impl_->require_connection(); !ready) {
        return ready;
    }

    auto removed = impl_->quote({"DELE " + path}, path);
    if (removed) {
        return {};
    }
    if (is_connection_error(removed.error().code)) {
        return removed;
    }

    auto still_there = impl_->size_of(path);
    if (still_there && !still_there.value().has_value()) {
        return {};
    }
    return unexpected(error{error_code::remote_io_error, removed.error().message});
}

auto ftp_transport::preferred_sub_write_size() const -> std::optional<std::size_t> {
    return std::nullopt;
}

}  // namespace kcenon::chunk_upload
