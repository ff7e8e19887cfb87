// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_WORKER_POOL_H
#define ARTDNA_WORKER_POOL_H

/**
 * Fixed-size pool of persistent worker threads draining a FIFO queue.
 *
 * submit() returns a future resolved by whichever worker picks the task
 * up first; completion order across tasks is not guaranteed. Each worker
 * owns its own handler instance from the factory.
 *
 * Failure handling:
 * - an ERROR response rejects that task's future with WorkerFailure; the
 *   worker keeps running
 * - an exception escaping the handler is a crash: the in-flight task is
 *   rejected with WorkerFailure, the thread is retired and a fresh worker
 *   (with a fresh handler) takes its slot
 * - terminate() rejects everything still queued
 *
 * No task is ever dropped without its future being resolved or rejected.
 */

#include <art_dna/dna_worker.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace art_dna {

class WorkerPool {
public:
    using HandlerFactory = std::function<std::unique_ptr<IWorkerHandler>()>;

    struct Stats {
        size_t total_workers{0};
        size_t available_workers{0};
        size_t queued_tasks{0};
        size_t pending_tasks{0};
        uint64_t restarts{0};
        size_t retired_workers{0};  // crashed threads not yet joined
        uint64_t completed{0};
        uint64_t failed{0};
        double avg_task_time_ms{0.0};  // exponential moving average
    };

    /** Pool of DNAWorker handlers sized from the config */
    explicit WorkerPool(const DNAConfig& config);

    WorkerPool(size_t pool_size, HandlerFactory factory);

    /** Stops the workers; queued tasks are rejected */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Start the worker threads.
     * @return false if already running
     */
    bool initialize();

    /** Stop and join every worker, rejecting still-queued tasks */
    void terminate();

    bool is_running() const { return m_running.load(); }

    /**
     * Queue a request. The message is stamped with a fresh task id.
     * If the pool is not running the future is already rejected.
     */
    std::future<WorkerResponse> submit(WorkerMessage message);

    /** Block until the queue is empty and no task is executing */
    void wait_for_completion();

    Stats get_stats() const;

private:
    struct Task {
        WorkerMessage message;
        std::promise<WorkerResponse> promise;
    };

    void WorkerThread(size_t slot);
    void FinishTask(double elapsed_ms, bool success);
    void Respawn(size_t slot);
    std::string NextTaskId();

    const size_t m_pool_size;
    HandlerFactory m_factory;

    std::deque<Task> m_queue;
    size_t m_busy{0};
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::condition_variable m_idle_cv;

    std::vector<std::thread> m_workers;
    std::vector<std::thread> m_retired;
    mutable std::mutex m_threads_mutex;
    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_next_task{0};

    mutable std::mutex m_stats_mutex;
    uint64_t m_restarts{0};
    uint64_t m_completed{0};
    uint64_t m_failed{0};
    double m_avg_task_time_ms{0.0};
};

} // namespace art_dna

#endif // ARTDNA_WORKER_POOL_H
