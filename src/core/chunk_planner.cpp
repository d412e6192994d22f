/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk range planning
 */

#include <kcenon/chunk_upload/core/chunk_planner.h>

#include <algorithm>
#include <string>

namespace kcenon::chunk_upload {

auto plan_chunk(uint64_t size, uint64_t chunk_size, uint64_t offset) -> result<chunk_plan> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "chunk size must be positive"});
    }

    if (size == 0) {
        return unexpected(error{error_code::local_file_empty, "file is empty"});
    }

    if (offset > size) {
        return unexpected(error{
            error_code::invalid_offset,
            "offset " + std::to_string(offset) + " exceeds file size " + std::to_string(size)});
    }

    chunk_plan plan;
    plan.offset = offset;
    plan.length = std::min(chunk_size, size - offset);
    plan.is_final = plan.end() >= size;
    return plan;
}

auto completion_percent(uint64_t offset, uint64_t size) noexcept -> double {
    if (size == 0 || offset >= size) {
        return 100.0;
    }
    return static_cast<double>(offset) * 100.0 / static_cast<double>(size);
}

auto remaining_chunks(uint64_t size, uint64_t chunk_size, uint64_t offset) noexcept -> uint64_t {
    if (chunk_size == 0 || offset >= size) {
        return 0;
    }
    const uint64_t remaining = size - offset;
    return remaining / chunk_size + (remaining % chunk_size != 0 ? 1 : 0);
}

}  // namespace kcenon::chunk_upload
