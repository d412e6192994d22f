/**
 * @file upload_example.cpp
 * @brief Upload one file chunk by chunk, the way a web front end drives the engine
 *
 * This example demonstrates:
 * - Building an upload_engine rooted at a local directory
 * - Checking a connection profile before uploading
 * - Calling transfer_chunk repeatedly and feeding new_offset back in
 * - Printing the JSON response of every call
 * - Switching the library logger to JSON records with masking
 */

#include <kcenon/chunk_upload/chunk_upload.h>
#include <kcenon/chunk_upload/core/logging.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::chunk_upload;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Chunk Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_root> <file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -P, --protocol <ftp|sftp>  Transfer protocol (default: sftp)" << std::endl;
    std::cout << "  -h, --host <host>          Server hostname (default: localhost)" << std::endl;
    std::cout << "  -p, --port <port>          Server port (default: protocol default)" << std::endl;
    std::cout << "  -u, --user <user>          Login user" << std::endl;
    std::cout << "  -c, --credential <value>   Password, private key text or key file path" << std::endl;
    std::cout << "                             (default: $CHUNK_UPLOAD_CREDENTIAL)" << std::endl;
    std::cout << "  -d, --remote-dir <dir>     Remote directory (default: login directory)" << std::endl;
    std::cout << "  -s, --chunk-size <bytes>   Chunk size (default: 8388608)" << std::endl;
    std::cout << "  --offset <bytes>           Offset to resume from (default: 0)" << std::endl;
    std::cout << "  --json-logs                Write log records as JSON" << std::endl;
    std::cout << "  --mask-logs                Hide hosts and directories in log records" << std::endl;
    std::cout << "  --help                     Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " -h files.example.org -u deploy -d /var/www ./site index.html" << std::endl;
    std::cout << "  " << program << " -P ftp -h ftp.local -u web ./site videos/intro.mp4" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    connection_profile profile;
    profile.host = "localhost";
    uint64_t offset = 0;
    std::string local_root;
    std::string file;

    if (const char* env = std::getenv("CHUNK_UPLOAD_CREDENTIAL")) {
        profile.credential = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        try {
            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-P" || arg == "--protocol") {
                auto value = next("--protocol");
                if (!value) return 1;
                auto parsed = parse_protocol(*value);
                if (!parsed) {
                    std::cerr << "Error: unknown protocol " << *value << std::endl;
                    return 1;
                }
                profile.protocol = *parsed;
            } else if (arg == "-h" || arg == "--host") {
                auto value = next("--host");
                if (!value) return 1;
                profile.host = *value;
            } else if (arg == "-p" || arg == "--port") {
                auto value = next("--port");
                if (!value) return 1;
                profile.port = static_cast<uint16_t>(std::stoi(*value));
            } else if (arg == "-u" || arg == "--user") {
                auto value = next("--user");
                if (!value) return 1;
                profile.user = *value;
            } else if (arg == "-c" || arg == "--credential") {
                auto value = next("--credential");
                if (!value) return 1;
                profile.credential = *value;
            } else if (arg == "-d" || arg == "--remote-dir") {
                auto value = next("--remote-dir");
                if (!value) return 1;
                profile.remote_dir = *value;
            } else if (arg == "-s" || arg == "--chunk-size") {
                auto value = next("--chunk-size");
                if (!value) return 1;
                profile.chunk_size = std::stoull(*value);
            } else if (arg == "--offset") {
                auto value = next("--offset");
                if (!value) return 1;
                offset = std::stoull(*value);
            } else if (arg == "--json-logs") {
                get_logger().enable_json_output(true);
            } else if (arg == "--mask-logs") {
                get_logger().enable_masking(true);
            } else if (arg[0] != '-') {
                if (local_root.empty()) {
                    local_root = arg;
                } else if (file.empty()) {
                    file = arg;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    if (local_root.empty() || file.empty()) {
        std::cerr << "Error: Both local_root and file are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto engine_result = upload_engine::builder()
        .with_local_root(local_root)
        .with_default_chunk_size(profile.chunk_size)
        .build();
    if (!engine_result.has_value()) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    std::cout << "[1/2] Testing connection to " << profile.remote_endpoint().to_string() << "..."
              << std::endl;
    auto identification = engine.test_connection(profile);
    if (!identification.has_value()) {
        std::cerr << "Connection test failed: " << identification.error().message << std::endl;
        return 1;
    }
    std::cout << "  Server: " << identification.value() << std::endl;

    std::cout << "[2/2] Uploading " << file << "..." << std::endl;
    file_transfer_state state(file);
    state.offset = offset;

    while (!state.complete) {
        auto response = engine.transfer_chunk(profile.make_request(state.file, state.offset));
        std::cout << response.to_json() << std::endl;

        if (!state.apply(response)) {
            std::cerr << "Upload stopped at " << format_bytes(state.offset)
                      << "; run again with --offset " << state.offset << " to resume" << std::endl;
            return 1;
        }
        std::cout << "  " << std::fixed << std::setprecision(2) << state.percent() << "% ("
                  << format_bytes(state.offset) << " / " << format_bytes(state.size) << ")"
                  << std::endl;
    }

    std::cout << "Upload complete: " << file << std::endl;
    return 0;
}
