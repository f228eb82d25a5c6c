// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Task pool adapters
 */

#include "kcenon/file_stream/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::file_stream::adapters {

namespace {

size_t resolve_worker_count(size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job running one std::function on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "upload_task")
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

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

std::shared_ptr<thread_system_pool_adapter> thread_system_pool_adapter::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto pending = pimpl_->pending;
    pending->fetch_add(1, std::memory_order_relaxed);

    auto wrapped_task = [task = std::move(task), promise, pending]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        pending->fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped_task)));
    return future;
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks() const {
    return pimpl_->pending->load(std::memory_order_relaxed);
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_upload_pool
// ============================================================================

struct async_upload_pool::impl {
    std::atomic<size_t> active_tasks{0};
};

async_upload_pool::async_upload_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_upload_pool::~async_upload_pool() = default;

std::future<void> async_upload_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);
    return std::async(std::launch::async, [state = pimpl_, task = std::move(task)]() {
        struct done_guard {
            impl* s;
            ~done_guard() { s->active_tasks.fetch_sub(1, std::memory_order_relaxed); }
        } guard{state.get()};
        task();
    });
}

size_t async_upload_pool::worker_count() const {
    return resolve_worker_count(0);
}

bool async_upload_pool::is_running() const { return true; }

size_t async_upload_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// upload_pool_factory
// ============================================================================

std::shared_ptr<upload_task_pool_interface> upload_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_upload_pool>();
#endif
}

}  // namespace kcenon::file_stream::adapters
