#include "common/worker_pool.hpp"
#include "common/logger.hpp"
#include <asio/post.hpp>
#include <exception>

WorkerPool::WorkerPool(size_t max_workers)
    : pool_(max_workers), max_workers_(max_workers) {}

WorkerPool::~WorkerPool() {
    join();
}

bool WorkerPool::acquire_slot_for(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!slot_freed_.wait_for(lock, wait, [this] { return in_use_ < max_workers_; })) {
        return false;
    }
    ++in_use_;
    return true;
}

void WorkerPool::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    slot_freed_.notify_one();
}

void WorkerPool::dispatch(std::function<void()> job) {
    asio::post(pool_, [this, job = std::move(job)]() {
        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERR("Worker job failed: ", e.what());
        }
        release_slot();
    });
}

void WorkerPool::join() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (joined_) return;
        joined_ = true;
    }
    pool_.join();
}

size_t WorkerPool::slots_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}
