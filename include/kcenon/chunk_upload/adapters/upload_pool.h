// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_pool.h
 * @brief Worker pool adapter for asynchronous engine calls
 *
 * Engine calls block on network I/O. Callers that need a non-blocking API
 * schedule them on an upload pool and receive a std::future.
 *
 * Features:
 * - Per-tag task tracking (e.g. "chunk", "batch")
 * - Integration with thread_system when available
 * - Fallback to one thread per task when thread_system is unavailable
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::chunk_upload::adapters {

/**
 * @brief Interface for worker pools used by the upload engine
 */
class upload_pool_interface {
public:
    virtual ~upload_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @param tag Tag used for pending-task accounting
     * @return Future for the task completion; exceptions thrown by the task
     *         are stored in it
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     const std::string& tag = "default") = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks submitted with a tag but not finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& tag) const = 0;
};

/**
 * @brief Submit a value-returning callable and get a typed future
 *
 * @code
 * auto pool = upload_pool_factory::create(2);
 * std::future<transfer_result> f = submit_for_result(*pool, [&] {
 *     return engine.transfer_chunk(request);
 * }, "chunk");
 * @endcode
 */
template <typename F>
auto submit_for_result(upload_pool_interface& pool, F&& fn, const std::string& tag = "default")
    -> std::future<std::invoke_result_t<F>> {
    using value_type = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<value_type()>>(std::forward<F>(fn));
    auto future = task->get_future();
    // The packaged_task stores the callable's value or exception; the void
    // future of the pool only signals completion.
    (void)pool.submit([task]() { (*task)(); }, tag);
    return future;
}

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Upload pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: all public methods may be called from multiple threads.
 */
class thread_system_upload_pool : public upload_pool_interface {
public:
    explicit thread_system_upload_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                       const std::string& pool_name = "chunk_upload_pool",
                                       size_t worker_count = 0);
    ~thread_system_upload_pool() override;

    thread_system_upload_pool(const thread_system_upload_pool&) = delete;
    thread_system_upload_pool& operator=(const thread_system_upload_pool&) = delete;

    /**
     * @brief Create a started pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "chunk_upload_pool");

    std::future<void> submit(std::function<void()> task,
                             const std::string& tag = "default") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& tag) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool running each task through std::async
 *
 * The pool owns the std::async futures and its destructor waits for every
 * task still running. The future handed to the caller is a plain promise
 * future, so dropping it does not block and submit_for_result() stays
 * asynchronous.
 */
class async_upload_pool : public upload_pool_interface {
public:
    async_upload_pool();
    ~async_upload_pool() override;

    async_upload_pool(const async_upload_pool&) = delete;
    async_upload_pool& operator=(const async_upload_pool&) = delete;

    std::future<void> submit(std::function<void()> task,
                             const std::string& tag = "default") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& tag) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available pool implementation
 *
 * 1. thread_system_upload_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_upload_pool (fallback)
 */
class upload_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "chunk_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::chunk_upload::adapters
