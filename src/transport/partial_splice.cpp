/**
 * @file partial_splice.cpp
 * @brief Implementation of append emulation
 */

#include <kcenon/chunk_upload/transport/partial_splice.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <string>

namespace kcenon::chunk_upload {

auto splice_partial(std::string_view path,
                    std::optional<std::vector<std::byte>> existing,
                    uint64_t offset,
                    std::span<const std::byte> data) -> result<std::vector<std::byte>> {
    if (!existing) {
        return unexpected(error{error_code::remote_size_mismatch,
                                "partial file " + std::string(path) + " vanished before append"});
    }

    auto content = std::move(*existing);
    if (content.size() < offset) {
        return unexpected(error{
            error_code::remote_size_mismatch,
            "partial file " + std::string(path) + " holds " + std::to_string(content.size()) +
                " bytes, expected " + std::to_string(offset)});
    }
    if (content.size() > offset) {
        CU_LOG_WARN(log_category::transport,
                    "Partial " + std::string(path) + " larger than offset, discarding " +
                        std::to_string(content.size() - offset) + " trailing bytes");
        content.resize(static_cast<std::size_t>(offset));
    }

    content.insert(content.end(), data.begin(), data.end());
    return content;
}

}  // namespace kcenon::chunk_upload
