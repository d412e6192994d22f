// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_pool.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/chunk_upload/adapters/upload_pool.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::chunk_upload::adapters {

// ============================================================================
// Tag accounting
// ============================================================================

namespace {

class tag_counter {
public:
    void increment(const std::string& tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[tag];
        ++total_;
    }

    void decrement(const std::string& tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(tag);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
            --total_;
        }
    }

    [[nodiscard]] size_t count(const std::string& tag) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(tag);
        return it != counts_.end() ? it->second : 0;
    }

    [[nodiscard]] size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
    size_t total_{0};
};

/**
 * @brief Run a task, settle its promise and release its tag
 */
void run_tracked(const std::function<void()>& task,
                 std::promise<void>& promise,
                 tag_counter& counter,
                 const std::string& tag) {
    std::exception_ptr failure;
    try {
        task();
    } catch (...) {
        failure = std::current_exception();
    }

    // Released before the promise is settled so a caller that waited on the
    // future observes the updated count
    counter.decrement(tag);
    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}

size_t default_worker_count() {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_upload_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job wrapping a function for thread_system execution
 */
class upload_job : public kcenon::thread::job {
public:
    explicit upload_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_upload_pool::impl {
    // Declared before the pool so running jobs finish before it is destroyed
    tag_counter counter;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
};

thread_system_upload_pool::thread_system_upload_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_upload_pool::~thread_system_upload_pool() = default;

std::shared_ptr<thread_system_upload_pool> thread_system_upload_pool::create_default(
    size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_upload_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_upload_pool::submit(std::function<void()> task,
                                                    const std::string& tag) {
    pimpl_->counter.increment(tag);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // Raw pointer is safe: the adapter outlives the jobs it queues
    auto* counter = &pimpl_->counter;
    auto wrapped = [task = std::move(task), promise, counter, tag]() {
        run_tracked(task, *promise, *counter, tag);
    };

    pimpl_->pool->enqueue(std::make_unique<upload_job>(std::move(wrapped), "upload_" + tag));
    return future;
}

size_t thread_system_upload_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_upload_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_upload_pool::pending_tasks() const {
    return pimpl_->counter.total();
}

size_t thread_system_upload_pool::pending_tasks(const std::string& tag) const {
    return pimpl_->counter.count(tag);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_upload_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_upload_pool implementation
// ============================================================================

struct async_upload_pool::impl {
    tag_counter counter;

    std::mutex mutex;
    std::vector<std::future<void>> running;

    void reap_finished() {
        std::erase_if(running, [](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }
};

async_upload_pool::async_upload_pool() : pimpl_(std::make_unique<impl>()) {}

async_upload_pool::~async_upload_pool() {
    std::vector<std::future<void>> running;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        running.swap(pimpl_->running);
    }
    for (auto& task : running) {
        task.wait();
    }
}

std::future<void> async_upload_pool::submit(std::function<void()> task, const std::string& tag) {
    pimpl_->counter.increment(tag);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The pool keeps the std::async future, so its destructor joins the task
    // while the caller's future stays non-blocking
    auto* pimpl = pimpl_.get();
    auto handle = std::async(std::launch::async,
                             [pimpl, promise, task = std::move(task), tag]() {
                                 run_tracked(task, *promise, pimpl->counter, tag);
                             });

    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->reap_finished();
    pimpl_->running.push_back(std::move(handle));
    return future;
}

size_t async_upload_pool::worker_count() const {
    return default_worker_count();
}

bool async_upload_pool::is_running() const { return true; }

size_t async_upload_pool::pending_tasks() const {
    return pimpl_->counter.total();
}

size_t async_upload_pool::pending_tasks(const std::string& tag) const {
    return pimpl_->counter.count(tag);
}

// ============================================================================
// upload_pool_factory implementation
// ============================================================================

std::shared_ptr<upload_pool_interface> upload_pool_factory::create(size_t worker_count,
                                                                   const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_pool::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_upload_pool>();
#endif
}

}  // namespace kcenon::chunk_upload::adapters
