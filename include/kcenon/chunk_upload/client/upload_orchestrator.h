/**
 * @file upload_orchestrator.h
 * @brief Caller-side driver uploading a list of files one chunk at a time
 */

#ifndef KCENON_CHUNK_UPLOAD_CLIENT_UPLOAD_ORCHESTRATOR_H
#define KCENON_CHUNK_UPLOAD_CLIENT_UPLOAD_ORCHESTRATOR_H

#include <kcenon/chunk_upload/client/connection_profile.h>
#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/session/transfer_types.h>
#include <kcenon/chunk_upload/session/upload_engine.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::chunk_upload {

/**
 * @brief Caller-level retry settings
 *
 * These wrap whole engine calls and are independent of the engine's
 * per-operation retry policy.
 */
struct orchestrator_config {
    /// Failed calls retried per file before the file is given up
    std::size_t max_file_retries = 5;

    /// Wait before retrying a failed call
    std::chrono::milliseconds retry_delay{3000};

    /// Wait function (defaults to thread_sleeper())
    sleeper_fn sleeper;
};

/**
 * @brief Progress snapshot reported after every successful call
 */
struct batch_progress {
    std::string file;
    double file_percent = 0.0;
    std::size_t files_done = 0;
    std::size_t files_total = 0;
    uint64_t bytes_transferred = 0;  ///< Bytes sent in this batch so far
    double bytes_per_second = 0.0;   ///< Average rate since the batch started
};

using progress_callback = std::function<void(const batch_progress&)>;

/**
 * @brief Final state of one file in a batch
 */
struct file_outcome {
    std::string file;
    bool success = false;
    uint64_t offset = 0;     ///< Last confirmed offset
    uint64_t size = 0;
    std::size_t calls = 0;   ///< Engine calls made for the file
    std::string message;     ///< Last failure message
    std::optional<transfer_failure> failure;
};

/**
 * @brief Result of a batch
 */
struct batch_summary {
    std::vector<file_outcome> completed;
    std::vector<file_outcome> failed;
    bool cancelled = false;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failed.empty() && !cancelled;
    }
};

/**
 * @brief Uploads files sequentially through an upload_engine
 *
 * For each file the orchestrator keeps a file_transfer_state and calls the
 * engine with the current offset until the file is complete. A failed call is
 * retried after retry_delay; the counter resets after each successful call.
 * When retries are exhausted the file is recorded as failed and the next file
 * starts.
 *
 * @note The orchestrator and engine must outlive run_async() futures.
 */
class upload_orchestrator {
public:
    upload_orchestrator(upload_engine& engine,
                        connection_profile profile,
                        orchestrator_config config = {});

    /**
     * @brief Cancels and waits for batches started by run_async()
     */
    ~upload_orchestrator();

    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;

    void on_progress(progress_callback callback);

    /**
     * @brief Upload files in order
     * @param files Paths relative to the engine's local root
     */
    [[nodiscard]] auto run(const std::vector<std::string>& files) -> batch_summary;

    /**
     * @brief Run the batch on the engine's worker pool
     *
     * The returned future stays valid after the orchestrator is destroyed;
     * destruction cancels the batch at its next engine call.
     */
    [[nodiscard]] auto run_async(std::vector<std::string> files) -> std::future<batch_summary>;

    /**
     * @brief Stop before the next engine call
     *
     * The chunk in flight completes; its remote partial file stays in place.
     */
    void cancel() noexcept;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

private:
    [[nodiscard]] auto upload_file(const std::string& file,
                                   std::size_t files_done,
                                   std::size_t files_total,
                                   batch_summary& summary) -> file_outcome;

    void report(const batch_progress& progress);

    upload_engine& engine_;
    connection_profile profile_;
    orchestrator_config config_;

    std::mutex callback_mutex_;
    progress_callback callback_;
    std::atomic<bool> cancelled_{false};

    std::mutex async_mutex_;
    std::condition_variable async_done_;
    std::size_t async_runs_ = 0;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_CLIENT_UPLOAD_ORCHESTRATOR_H
