/**
 * @file local_source.cpp
 * @brief Implementation of ranged local file reads
 */

#include <kcenon/chunk_upload/core/local_source.h>

#include <string>

namespace kcenon::chunk_upload {

local_source::local_source(std::filesystem::path path, std::ifstream stream, uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

auto local_source::open(const std::filesystem::path& path) -> result<local_source> {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected(
            error{error_code::local_file_not_found, "local file not found: " + path.string()});
    }

    if (!std::filesystem::is_regular_file(status)) {
        return unexpected(
            error{error_code::local_file_unreadable, "not a regular file: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::local_file_unreadable, "cannot get file size: " + path.string()});
    }

    if (file_size == 0) {
        return unexpected(
            error{error_code::local_file_empty, "local file is empty: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected(
            error{error_code::local_file_unreadable, "cannot open file: " + path.string()});
    }

    return local_source(path, std::move(stream), static_cast<uint64_t>(file_size));
}

auto local_source::read(uint64_t offset, uint64_t length) -> result<std::vector<std::byte>> {
    if (offset > size_ || length > size_ - offset) {
        return unexpected(error{
            error_code::local_short_read,
            "range [" + std::to_string(offset) + ", " + std::to_string(offset + length) +
                ") exceeds file size " + std::to_string(size_)});
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        return unexpected(error{
            error_code::local_seek_failed,
            "seek to " + std::to_string(offset) + " failed: " + path_.string()});
    }

    std::vector<std::byte> buffer(static_cast<std::size_t>(length));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    auto bytes_read = static_cast<uint64_t>(stream_.gcount());

    if (bytes_read != length) {
        return unexpected(error{
            error_code::local_short_read,
            "expected " + std::to_string(length) + " bytes, read " + std::to_string(bytes_read)});
    }

    return buffer;
}

}  // namespace kcenon::chunk_upload
