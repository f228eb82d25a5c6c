// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Task pool used for batch fan-out and server connections
 *
 * Uses thread_system's thread_pool when available and falls back to
 * std::async otherwise.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::file_stream::adapters {

/**
 * @brief Interface for running upload tasks
 */
class upload_task_pool_interface {
public:
    virtual ~upload_task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future completing when the task has run; it carries any
     *         exception the task threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted and not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM
/**
 * @brief Adapter over thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public upload_task_pool_interface {
public:
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "file_stream_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create and start a pool with @p worker_count workers
     * @param worker_count 0 selects the hardware concurrency
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "file_stream_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};
#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback running every task on its own std::async thread
 */
class async_upload_pool : public upload_task_pool_interface {
public:
    async_upload_pool();
    ~async_upload_pool() override;

    async_upload_pool(const async_upload_pool&) = delete;
    async_upload_pool& operator=(const async_upload_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Selects thread_system when built with it, std::async otherwise
 */
class upload_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_task_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "file_stream_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::file_stream::adapters
