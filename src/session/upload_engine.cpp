/**
 * @file upload_engine.cpp
 * @brief Implementation of the upload engine call boundary
 */

#include <kcenon/chunk_upload/session/upload_engine.h>
#include <kcenon/chunk_upload/core/logging.h>
#include <kcenon/chunk_upload/session/transfer_session.h>
#include <kcenon/chunk_upload/transport/credential.h>

#include <exception>
#include <mutex>
#include <system_error>

namespace kcenon::chunk_upload {

namespace {

auto run_session(const engine_config& config, const transfer_request& request) -> transfer_result {
    try {
        transfer_session session(config, request);
        return session.run();
    } catch (const std::exception& e) {
        transfer_log_context ctx;
        ctx.file = request.file;
        ctx.offset = request.offset;
        ctx.error_message = e.what();
        CU_LOG_ERROR_CTX(log_category::engine, "Unexpected exception during chunk transfer", ctx);
        return transfer_result::make_failure(
            error{error_code::internal_error, std::string("unexpected exception: ") + e.what()},
            request.file, request.offset);
    } catch (...) {
        CU_LOG_ERROR(log_category::engine,
                     "Unknown exception during chunk transfer of " + request.file);
        return transfer_result::make_failure(
            error{error_code::internal_error, "unknown exception"}, request.file, request.offset);
    }
}

}  // namespace

struct upload_engine::impl {
    engine_config config;
    std::shared_ptr<adapters::upload_pool_interface> pool;
    std::mutex pool_mutex;

    explicit impl(engine_config cfg, std::shared_ptr<adapters::upload_pool_interface> p)
        : config(std::move(cfg)), pool(std::move(p)) {
        if (!config.sleeper) {
            config.sleeper = thread_sleeper();
        }
        if (!config.factory) {
            config.factory = create_transport;
        }
    }

    auto get_pool() -> std::shared_ptr<adapters::upload_pool_interface> {
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (!pool) {
            pool = adapters::upload_pool_factory::create(0, "chunk_upload_engine");
        }
        return pool;
    }
};

// ============================================================================
// builder
// ============================================================================

upload_engine::builder::builder() = default;

auto upload_engine::builder::with_local_root(const std::filesystem::path& root) -> builder& {
    config_.local_root = root;
    return *this;
}

auto upload_engine::builder::with_default_chunk_size(uint64_t size) -> builder& {
    config_.default_chunk_size = size;
    return *this;
}

auto upload_engine::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto upload_engine::builder::with_verify_retries(std::size_t retries) -> builder& {
    config_.verify_retries = retries;
    return *this;
}

auto upload_engine::builder::with_transport_config(const transport_config& config) -> builder& {
    config_.transport = config;
    return *this;
}

auto upload_engine::builder::with_sleeper(sleeper_fn sleeper) -> builder& {
    config_.sleeper = std::move(sleeper);
    return *this;
}

auto upload_engine::builder::with_transport_factory(transport_factory_fn factory) -> builder& {
    config_.factory = std::move(factory);
    return *this;
}

auto upload_engine::builder::with_worker_pool(std::shared_ptr<adapters::upload_pool_interface> pool)
    -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_engine::builder::build() -> result<upload_engine> {
    if (config_.default_chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "default chunk size must be positive"});
    }
    if (config_.retry.max_attempts == 0) {
        return unexpected(error{error_code::invalid_request, "retry policy needs at least one attempt"});
    }
    if (!config_.local_root.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(config_.local_root, ec)) {
            return unexpected(error{error_code::local_file_not_found,
                                    "local root is not a directory: " + config_.local_root.string()});
        }
    }

    return upload_engine{std::move(config_), std::move(pool_)};
}

// ============================================================================
// upload_engine
// ============================================================================

upload_engine::upload_engine(engine_config config,
                             std::shared_ptr<adapters::upload_pool_interface> pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(pool))) {
    get_logger().initialize();
}

upload_engine::upload_engine(upload_engine&&) noexcept = default;
auto upload_engine::operator=(upload_engine&&) noexcept -> upload_engine& = default;
upload_engine::~upload_engine() = default;

auto upload_engine::transfer_chunk(const transfer_request& request) -> transfer_result {
    return run_session(impl_->config, request);
}

auto upload_engine::transfer_chunk_async(transfer_request request) -> std::future<transfer_result> {
    auto pool = impl_->get_pool();
    // The task owns a copy of the configuration, never the engine or its pool
    return adapters::submit_for_result(
        *pool,
        [config = impl_->config, request = std::move(request)]() {
            return run_session(config, request);
        },
        "chunk");
}

auto upload_engine::test_connection(const connection_profile& profile) -> result<std::string> {
    if (profile.host.empty() || profile.user.empty()) {
        return unexpected(error{error_code::missing_field, "host and user are required"});
    }

    auto created = impl_->config.factory(profile.protocol, impl_->config.transport);
    if (!created) {
        return unexpected(created.error());
    }
    auto transport = std::move(created.value());
    if (!transport) {
        return unexpected(error{error_code::internal_error, "transport factory returned null"});
    }

    retry_policy policy = impl_->config.retry;
    if (profile.max_retries > 0) {
        policy.max_attempts = profile.max_retries;
    }
    retry_controller retry(policy, impl_->config.sleeper);

    const auto remote = profile.remote_endpoint();
    const auto cred = classify_credential(profile.credential);

    auto connected = retry.run<void>("connect " + remote.to_string(), nullptr, [&]() -> result<void> {
        transport->close();
        if (auto opened = transport->connect(remote); !opened) {
            return opened;
        }
        return transport->authenticate(profile.user, cred);
    });

    if (!connected) {
        transport->close();
        return unexpected(connected.error());
    }

    auto identification = transport->server_identification();
    transport->close();

    CU_LOG_INFO(log_category::engine,
                std::string("Connection test succeeded for ") + to_string(profile.protocol) +
                    "://" + remote.to_string());
    return identification;
}

auto upload_engine::config() const -> const engine_config& {
    return impl_->config;
}

auto upload_engine::worker_pool() const -> std::shared_ptr<adapters::upload_pool_interface> {
    return impl_->get_pool();
}

}  // namespace kcenon::chunk_upload
