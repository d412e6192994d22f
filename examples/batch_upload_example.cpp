/**
 * @file batch_upload_example.cpp
 * @brief Upload every file under a directory with the batch orchestrator
 *
 * This example demonstrates:
 * - Enumerating a local site with the default exclusions
 * - Driving the engine with upload_orchestrator
 * - Reporting batch progress and a final summary
 * - Cancelling the batch from SIGINT
 */

#include <kcenon/chunk_upload/chunk_upload.h>

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace kcenon::chunk_upload;

namespace {

upload_orchestrator* g_orchestrator = nullptr;

void handle_interrupt(int) {
    if (g_orchestrator != nullptr) {
        g_orchestrator->cancel();
    }
}

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Chunk Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <ftp|sftp> <host> <user> <local_root> <remote_dir>"
              << std::endl;
    std::cout << std::endl;
    std::cout << "The credential is read from $CHUNK_UPLOAD_CREDENTIAL." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 6) {
        print_usage(argv[0]);
        return 1;
    }

    auto protocol = parse_protocol(argv[1]);
    if (!protocol) {
        std::cerr << "Error: unknown protocol " << argv[1] << std::endl;
        return 1;
    }

    connection_profile profile;
    profile.protocol = *protocol;
    profile.host = argv[2];
    profile.user = argv[3];
    profile.remote_dir = argv[5];
    if (const char* env = std::getenv("CHUNK_UPLOAD_CREDENTIAL")) {
        profile.credential = env;
    }
    const std::string local_root = argv[4];

    auto files = file_enumerator().enumerate(local_root);
    if (!files.has_value()) {
        std::cerr << "Failed to list files: " << files.error().message << std::endl;
        return 1;
    }
    std::cout << "Found " << files.value().size() << " files under " << local_root << std::endl;

    auto engine_result = upload_engine::builder().with_local_root(local_root).build();
    if (!engine_result.has_value()) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    upload_orchestrator orchestrator(engine, profile);
    orchestrator.on_progress([](const batch_progress& progress) {
        std::cout << "\r[" << progress.files_done << "/" << progress.files_total << "] "
                  << progress.file << " " << std::fixed << std::setprecision(1)
                  << progress.file_percent << "% "
                  << std::setprecision(2) << progress.bytes_per_second / (1024.0 * 1024.0)
                  << " MB/s     " << std::flush;
    });

    g_orchestrator = &orchestrator;
    std::signal(SIGINT, handle_interrupt);

    auto summary = orchestrator.run(files.value());
    g_orchestrator = nullptr;
    std::cout << std::endl;

    std::cout << "========================================" << std::endl;
    std::cout << "  Completed: " << summary.completed.size() << std::endl;
    std::cout << "  Failed:    " << summary.failed.size() << std::endl;
    std::cout << "  Bytes:     " << summary.bytes_transferred << std::endl;
    std::cout << "  Elapsed:   " << summary.elapsed.count() << " ms" << std::endl;
    if (summary.cancelled) {
        std::cout << "  Batch was cancelled; partial files stay on the server" << std::endl;
    }
    for (const auto& failed : summary.failed) {
        std::cout << "  FAILED " << failed.file << " at offset " << failed.offset << ": "
                  << failed.message << std::endl;
    }
    std::cout << "========================================" << std::endl;

    return summary.all_succeeded() ? 0 : 1;
}
