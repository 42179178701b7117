// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.h
 * @brief Worker pool adapter for parallel upload tasks
 *
 * Upload tasks of one chunk are submitted here and the scheduler waits on
 * the returned futures. The adapter runs on thread_system's thread_pool
 * when it is linked and falls back to std::async otherwise.
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

namespace kcenon::bulk_upload::adapters {

/**
 * @brief Interface for executing upload tasks
 */
class upload_worker_pool {
public:
    virtual ~upload_worker_pool() = default;

    /**
     * @brief Submit a task for execution
     * @return Future completing when the task has run; it carries any
     *         exception the task threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: all public methods may be called from multiple threads.
 */
class thread_system_worker_pool : public upload_worker_pool {
public:
    thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                              const std::string& pool_name,
                              size_t worker_count);
    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create a started pool
     * @param worker_count Number of workers (0 = default_worker_count())
     * @param pool_name Name for identification in logs
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool running each task through std::async
 *
 * Parallelism is bounded by the caller: the scheduler never has more than
 * one chunk in flight.
 */
class async_worker_pool : public upload_worker_pool {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available worker pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_worker_pool> create(
        size_t worker_count = 0,
        const std::string& pool_name = "bulk_upload_pool");

    /**
     * @brief Worker count used when 0 is requested
     *
     * Never below the highest concurrency a batch can be assigned, so a
     * chunk of small files is not serialized on a machine with few cores.
     */
    [[nodiscard]] static size_t default_worker_count();

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::bulk_upload::adapters
