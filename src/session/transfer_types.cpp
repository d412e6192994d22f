/**
 * @file transfer_types.cpp
 * @brief Engine result rendering and caller state updates
 */

#include <kcenon/chunk_upload/session/transfer_types.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <iomanip>
#include <sstream>

namespace kcenon::chunk_upload {

auto transfer_result::make_failure(const error& err, const std::string& file, uint64_t offset)
    -> transfer_result {
    transfer_result outcome;
    outcome.success = false;
    outcome.requested_offset = offset;
    outcome.reconciled_offset = offset;
    outcome.new_offset = offset;

    transfer_failure failure;
    failure.kind = kind_of(err.code);
    failure.code = err.code;
    failure.message = err.message;
    failure.file = file;
    failure.offset = offset;
    outcome.failure = std::move(failure);
    return outcome;
}

auto transfer_result::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{";

    if (success) {
        oss << "\"success\":true"
            << ",\"new_offset\":" << new_offset
            << ",\"filesize\":" << file_size
            << ",\"percent\":" << std::fixed << std::setprecision(2) << percent
            << ",\"bytes_sent\":" << bytes_sent
            << ",\"complete\":" << (complete ? "true" : "false");
        if (reconciliation) {
            oss << ",\"reconciled_offset\":" << reconciled_offset
                << ",\"reconciliation\":\"" << to_string(*reconciliation) << "\"";
        }
    } else {
        const std::string message = failure ? failure->message : std::string("unknown failure");
        const std::string file = failure ? failure->file : std::string();
        const uint64_t offset = failure ? failure->offset : new_offset;
        oss << "\"success\":false"
            << ",\"message\":\"" << detail::escape_json_string(message) << "\""
            << ",\"file\":\"" << detail::escape_json_string(file) << "\""
            << ",\"offset\":" << offset;
        if (failure) {
            oss << ",\"error_kind\":\"" << to_string(failure->kind) << "\""
                << ",\"error_code\":" << static_cast<int32_t>(failure->code);
        }
    }

    oss << "}";
    return oss.str();
}

auto file_transfer_state::apply(const transfer_result& outcome) -> bool {
    if (!outcome.success) {
        return false;
    }

    size = outcome.file_size;
    offset = outcome.new_offset < size ? outcome.new_offset : size;
    complete = offset == size;
    return true;
}

}  // namespace kcenon::chunk_upload
