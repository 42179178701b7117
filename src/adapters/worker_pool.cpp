// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/bulk_upload/adapters/worker_pool.h"

#include <algorithm>
#include <thread>

#include "kcenon/bulk_upload/core/concurrency_controller.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::bulk_upload::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    return requested != 0 ? requested : worker_pool_factory::default_worker_count();
}

}  // namespace

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job wrapping one upload task for thread_system
 */
class upload_job : public kcenon::thread::job {
public:
    explicit upload_job(std::function<void()> func)
        : job("upload_task"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

std::shared_ptr<thread_system_worker_pool> thread_system_worker_pool::create(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name,
                                                       worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);
    auto* in_flight = &pimpl_->in_flight;
    auto wrapped = [task = std::move(task), promise, in_flight]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        in_flight->fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<upload_job>(std::move(wrapped)));
    return future;
}

size_t thread_system_worker_pool::worker_count() const { return pimpl_->worker_count; }

bool thread_system_worker_pool::is_running() const { return pimpl_->pool != nullptr; }

size_t thread_system_worker_pool::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
};

async_worker_pool::async_worker_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async, [pimpl, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            pimpl->in_flight.fetch_sub(1, std::memory_order_relaxed);
            throw;
        }
        pimpl->in_flight.fetch_sub(1, std::memory_order_relaxed);
    });
}

size_t async_worker_pool::worker_count() const { return pimpl_->worker_count; }

bool async_worker_pool::is_running() const { return true; }

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

// ============================================================================
// worker_pool_factory
// ============================================================================

size_t worker_pool_factory::default_worker_count() {
    const size_t hw = std::thread::hardware_concurrency();
    return std::max<size_t>(hw, concurrency_controller::small_file_concurrency);
}

std::shared_ptr<upload_worker_pool> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::bulk_upload::adapters
