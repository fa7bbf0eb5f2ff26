#ifndef RIFT_WORKER_POOL_HPP
#define RIFT_WORKER_POOL_HPP

#include <asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

/**
 * @brief Fixed-size worker pool with explicit admission slots.
 *
 * A caller first acquires a slot (blocking, with a timeout so it can poll its own flags),
 * then hands a job to dispatch(). The slot is released when the job returns. The number of
 * jobs queued or running never exceeds the capacity, so whoever is waiting for a slot has
 * not dispatched yet.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t max_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false if no slot became free within `wait`.
    bool acquire_slot_for(std::chrono::milliseconds wait);

    // Gives back a slot acquired with acquire_slot_for() that was not used for dispatch().
    void release_slot();

    // Runs `job` on a pool thread. The caller must hold a slot; it is released after `job`.
    void dispatch(std::function<void()> job);

    // Waits for queued jobs to finish and stops the threads. Idempotent.
    void join();

    size_t capacity() const { return max_workers_; }
    size_t slots_in_use() const;

private:
    asio::thread_pool pool_;
    const size_t max_workers_;
    size_t in_use_ = 0;
    bool joined_ = false;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
};

#endif // RIFT_WORKER_POOL_HPP
