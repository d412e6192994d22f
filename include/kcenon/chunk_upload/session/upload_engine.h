/**
 * @file upload_engine.h
 * @brief Stateless entry point of the resumable chunk upload engine
 */

#ifndef KCENON_CHUNK_UPLOAD_SESSION_UPLOAD_ENGINE_H
#define KCENON_CHUNK_UPLOAD_SESSION_UPLOAD_ENGINE_H

#include <kcenon/chunk_upload/adapters/upload_pool.h>
#include <kcenon/chunk_upload/client/connection_profile.h>
#include <kcenon/chunk_upload/core/types.h>
#include <kcenon/chunk_upload/session/retry_controller.h>
#include <kcenon/chunk_upload/session/retry_policy.h>
#include <kcenon/chunk_upload/session/transfer_types.h>
#include <kcenon/chunk_upload/transport/transport_config.h>
#include <kcenon/chunk_upload/transport/transport_factory.h>

#include <filesystem>
#include <future>
#include <memory>
#include <string>

namespace kcenon::chunk_upload {

/**
 * @brief Resumable chunk upload engine
 *
 * Each transfer_chunk() call uploads at most one chunk of one file over a
 * connection it opens and closes itself. All progress lives in the caller's
 * file_transfer_state, so any call may follow a crash or a lost response.
 * Calls for the same file must be serialized by the caller; calls for
 * different files may run concurrently.
 *
 * @code
 * auto engine = upload_engine::builder()
 *     .with_local_root("/var/www/site")
 *     .build();
 *
 * file_transfer_state state("backups/site.tar.gz");
 * while (!state.complete) {
 *     auto outcome = engine.value().transfer_chunk(profile.make_request(state.file, state.offset));
 *     if (!state.apply(outcome)) break;
 * }
 * @endcode
 */
class upload_engine {
public:
    /**
     * @brief Builder for upload_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Directory relative file paths are resolved against
         */
        auto with_local_root(const std::filesystem::path& root) -> builder&;

        /**
         * @brief Chunk size used when requests do not carry one (default: 8 MiB)
         */
        auto with_default_chunk_size(uint64_t size) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        /**
         * @brief Local retries of a sub-write whose size does not verify (default: 3)
         */
        auto with_verify_retries(std::size_t retries) -> builder&;

        auto with_transport_config(const transport_config& config) -> builder&;

        /**
         * @brief Replace the wait between retries (tests pass a no-op)
         */
        auto with_sleeper(sleeper_fn sleeper) -> builder&;

        /**
         * @brief Replace the transport constructor
         */
        auto with_transport_factory(transport_factory_fn factory) -> builder&;

        /**
         * @brief Pool used by transfer_chunk_async (default: upload_pool_factory)
         */
        auto with_worker_pool(std::shared_ptr<adapters::upload_pool_interface> pool) -> builder&;

        [[nodiscard]] auto build() -> result<upload_engine>;

    private:
        engine_config config_;
        std::shared_ptr<adapters::upload_pool_interface> pool_;
    };

    // Non-copyable, movable
    upload_engine(const upload_engine&) = delete;
    auto operator=(const upload_engine&) -> upload_engine& = delete;
    upload_engine(upload_engine&&) noexcept;
    auto operator=(upload_engine&&) noexcept -> upload_engine&;
    ~upload_engine();

    /**
     * @brief Upload the next chunk of a file
     *
     * Never throws. Failures are reported in transfer_result::failure with the
     * file and the offset at the time of failure; the remote partial file is
     * preserved for resumption.
     */
    [[nodiscard]] auto transfer_chunk(const transfer_request& request) -> transfer_result;

    /**
     * @brief Schedule transfer_chunk() on the worker pool
     */
    [[nodiscard]] auto transfer_chunk_async(transfer_request request)
        -> std::future<transfer_result>;

    /**
     * @brief Connect and authenticate with a profile
     * @return Server identification (FTP greeting or SSH banner)
     */
    [[nodiscard]] auto test_connection(const connection_profile& profile) -> result<std::string>;

    [[nodiscard]] auto config() const -> const engine_config&;

    /**
     * @brief Worker pool shared with the orchestrator
     */
    [[nodiscard]] auto worker_pool() const -> std::shared_ptr<adapters::upload_pool_interface>;

private:
    upload_engine(engine_config config, std::shared_ptr<adapters::upload_pool_interface> pool);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunk_upload

#endif  // KCENON_CHUNK_UPLOAD_SESSION_UPLOAD_ENGINE_H
