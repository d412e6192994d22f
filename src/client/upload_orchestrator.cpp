/**
 * @file upload_orchestrator.cpp
 * @brief Implementation of the sequential batch driver
 */

#include <kcenon/chunk_upload/client/upload_orchestrator.h>
#include <kcenon/chunk_upload/core/logging.h>

namespace kcenon::chunk_upload {

upload_orchestrator::upload_orchestrator(upload_engine& engine,
                                         connection_profile profile,
                                         orchestrator_config config)
    : engine_(engine), profile_(std::move(profile)), config_(std::move(config)) {
    if (!config_.sleeper) {
        config_.sleeper = thread_sleeper();
    }
}

upload_orchestrator::~upload_orchestrator() {
    cancel();
    std::unique_lock<std::mutex> lock(async_mutex_);
    async_done_.wait(lock, [this]() { return async_runs_ == 0; });
}

void upload_orchestrator::on_progress(progress_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void upload_orchestrator::cancel() noexcept {
    cancelled_.store(true);
}

auto upload_orchestrator::is_cancelled() const noexcept -> bool {
    return cancelled_.load();
}

void upload_orchestrator::report(const batch_progress& progress) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        callback_(progress);
    }
}

auto upload_orchestrator::run(const std::vector<std::string>& files) -> batch_summary {
    batch_summary summary;
    started_ = std::chrono::steady_clock::now();

    CU_LOG_INFO(log_category::orchestrator,
                "Starting batch of " + std::to_string(files.size()) + " files");

    for (std::size_t index = 0; index < files.size(); ++index) {
        if (is_cancelled()) {
            summary.cancelled = true;
            break;
        }

        auto outcome = upload_file(files[index], index, files.size(), summary);
        if (outcome.success) {
            summary.completed.push_back(std::move(outcome));
        } else {
            summary.failed.push_back(std::move(outcome));
        }
    }

    if (is_cancelled()) {
        summary.cancelled = true;
    }
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);

    if (summary.all_succeeded()) {
        CU_LOG_INFO(log_category::orchestrator,
                    "All files transferred successfully in " +
                        std::to_string(summary.elapsed.count()) + "ms");
    } else {
        CU_LOG_WARN(log_category::orchestrator,
                    "Transfer completed with errors: " + std::to_string(summary.failed.size()) +
                        " failed" + (summary.cancelled ? ", cancelled" : ""));
    }
    return summary;
}

auto upload_orchestrator::upload_file(const std::string& file,
                                      std::size_t files_done,
                                      std::size_t files_total,
                                      batch_summary& summary) -> file_outcome {
    file_transfer_state state(file);
    file_outcome outcome;
    outcome.file = file;

    std::size_t retries = 0;
    bool applied = false;
    while (!state.complete) {
        if (is_cancelled()) {
            outcome.message = "cancelled";
            break;
        }

        auto response = engine_.transfer_chunk(profile_.make_request(state.file, state.offset));
        ++outcome.calls;

        if (state.apply(response)) {
            applied = true;
            retries = 0;
            summary.bytes_transferred += response.bytes_sent;

            const auto elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - started_).count();

            batch_progress progress;
            progress.file = file;
            progress.file_percent = state.percent();
            progress.files_done = files_done + (state.complete ? 1 : 0);
            progress.files_total = files_total;
            progress.bytes_transferred = summary.bytes_transferred;
            progress.bytes_per_second =
                elapsed > 0.0 ? static_cast<double>(summary.bytes_transferred) / elapsed : 0.0;
            report(progress);
            continue;
        }

        outcome.failure = response.failure;
        outcome.message = response.failure ? response.failure->message : "unknown failure";
        // The state only changes on success; remember the size for the summary
        if (!applied && response.file_size > 0) {
            outcome.size = response.file_size;
        }

        if (retries >= config_.max_file_retries) {
            CU_LOG_ERROR(log_category::orchestrator,
                         "Failed to upload " + file + " after " +
                             std::to_string(config_.max_file_retries) +
                             " retries. Moving to next file.");
            break;
        }

        ++retries;
        CU_LOG_WARN(log_category::orchestrator,
                    "Error uploading " + file + ": " + outcome.message + ". Retry " +
                        std::to_string(retries) + "/" + std::to_string(config_.max_file_retries));
        config_.sleeper(config_.retry_delay);
    }

    outcome.success = state.complete;
    outcome.offset = state.offset;
    if (applied) {
        outcome.size = state.size;
    }
    if (outcome.success) {
        outcome.message.clear();
        outcome.failure.reset();
        CU_LOG_INFO(log_category::orchestrator, file + " uploaded successfully.");
    }
    return outcome;
}

auto upload_orchestrator::run_async(std::vector<std::string> files) -> std::future<batch_summary> {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        ++async_runs_;
    }

    // Released when the batch returns or throws; the destructor waits on it
    struct run_guard {
        upload_orchestrator* self;
        ~run_guard() {
            std::lock_guard<std::mutex> lock(self->async_mutex_);
            --self->async_runs_;
            self->async_done_.notify_all();
        }
    };

    auto pool = engine_.worker_pool();
    return adapters::submit_for_result(
        *pool,
        [this, files = std::move(files)]() {
            run_guard guard{this};
            return run(files);
        },
        "batch");
}

}  // namespace kcenon::chunk_upload
