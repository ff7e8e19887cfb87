// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/worker_pool.h>

#include <art_dna/dna_errors.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <optional>

namespace art_dna {

WorkerPool::WorkerPool(const DNAConfig& config)
    : WorkerPool(config.worker_pool_size, [config]() { return std::unique_ptr<IWorkerHandler>(new DNAWorker(config)); }) {}

WorkerPool::WorkerPool(size_t pool_size, HandlerFactory factory)
    : m_pool_size(std::max<size_t>(pool_size, 1)), m_factory(std::move(factory)) {}

WorkerPool::~WorkerPool() {
    terminate();
}

bool WorkerPool::initialize() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_running.load()) {
            return false;  // Already running
        }
        m_running.store(true);
    }

    std::lock_guard<std::mutex> lock(m_threads_mutex);
    m_workers.clear();
    for (size_t i = 0; i < m_pool_size; i++) {
        m_workers.emplace_back(&WorkerPool::WorkerThread, this, i);
    }
    LogPrintWorker(INFO, "Worker pool started with %zu workers", m_pool_size);
    return true;
}

void WorkerPool::terminate() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running.load()) {
            return;  // Already stopped
        }
        m_running.store(false);
    }
    m_queue_cv.notify_all();

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_threads_mutex);
        threads.swap(m_workers);
        for (std::thread& t : m_retired) threads.push_back(std::move(t));
        m_retired.clear();
    }
    for (std::thread& t : threads) {
        if (t.joinable()) t.join();
    }

    std::deque<Task> leftover;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        leftover.swap(m_queue);
    }
    for (Task& task : leftover) {
        task.promise.set_exception(std::make_exception_ptr(
            WorkerFailure("Worker pool terminated before task " + task.message.task_id + " ran")));
    }
    if (!leftover.empty()) {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_failed += leftover.size();
    }
    m_idle_cv.notify_all();

    LogPrintWorker(INFO, "Worker pool terminated (%zu queued tasks rejected)", leftover.size());
}

std::string WorkerPool::NextTaskId() {
    return strprintf("task_%lld_%llu", static_cast<long long>(GetTimeMillis()),
                     static_cast<unsigned long long>(m_next_task.fetch_add(1)));
}

std::future<WorkerResponse> WorkerPool::submit(WorkerMessage message) {
    std::promise<WorkerResponse> promise;
    std::future<WorkerResponse> future = promise.get_future();
    message.task_id = NextTaskId();

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running.load()) {
            promise.set_exception(std::make_exception_ptr(
                WorkerFailure("Worker pool is not running; task " + message.task_id + " rejected")));
            return future;
        }
        m_queue.push_back(Task{std::move(message), std::move(promise)});
    }
    m_queue_cv.notify_one();
    return future;
}

void WorkerPool::wait_for_completion() {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_idle_cv.wait(lock, [this] { return m_queue.empty() && m_busy == 0; });
}

WorkerPool::Stats WorkerPool::get_stats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        stats.total_workers = m_running.load() ? m_pool_size : 0;
        stats.pending_tasks = m_busy;
        stats.queued_tasks = m_queue.size();
        stats.available_workers = stats.total_workers > m_busy ? stats.total_workers - m_busy : 0;
    }
    {
        std::lock_guard<std::mutex> lock(m_threads_mutex);
        stats.retired_workers = m_retired.size();
    }
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    stats.restarts = m_restarts;
    stats.completed = m_completed;
    stats.failed = m_failed;
    stats.avg_task_time_ms = m_avg_task_time_ms;
    return stats;
}

void WorkerPool::FinishTask(double elapsed_ms, bool success) {
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (success) {
            m_completed++;
        } else {
            m_failed++;
        }
        uint64_t samples = m_completed + m_failed;
        m_avg_task_time_ms = samples <= 1 ? elapsed_ms : (m_avg_task_time_ms * 7.0 + elapsed_ms) / 8.0;
    }
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_busy--;
    }
    m_idle_cv.notify_all();
}

void WorkerPool::Respawn(size_t slot) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(m_threads_mutex);
        if (!m_running.load()) {
            return;  // terminate() joins this thread
        }
        // Earlier retirees have left their loop; only the calling thread stays parked
        finished.swap(m_retired);
        m_retired.push_back(std::move(m_workers[slot]));
        m_workers[slot] = std::thread(&WorkerPool::WorkerThread, this, slot);
    }
    for (std::thread& t : finished) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::WorkerThread(size_t slot) {
    std::unique_ptr<IWorkerHandler> handler = m_factory();
    LogPrintWorker(DEBUG, "Worker %zu started", slot);

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running.load();
            });
            if (!m_running.load()) {
                break;  // Shutting down; terminate() rejects what is left
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy++;
        }

        const std::string& task_id = task.message.task_id;
        double start = GetSteadyMillis();

        std::optional<WorkerResponse> response;
        std::string crash;
        try {
            response = handler->handle(task.message);
        } catch (const std::exception& e) {
            crash = e.what();
        } catch (...) {
            crash = "non-standard exception";
        }
        double elapsed = std::max(0.0, GetSteadyMillis() - start);

        if (!response) {
            LogPrintWorker(ERROR, "%s", CErrorFormatter::FormatForLog(CErrorFormatter::WorkerError(
                WorkerMessageTypeName(task.message.type), "worker " + std::to_string(slot) +
                " crashed on " + task_id + ": " + crash)).c_str());
            task.promise.set_exception(std::make_exception_ptr(
                WorkerFailure("Worker crashed on task " + task_id + ": " + crash)));
            {
                std::lock_guard<std::mutex> lock(m_stats_mutex);
                m_restarts++;
            }
            FinishTask(elapsed, false);
            Respawn(slot);
            return;
        }

        response->task_id = task_id;
        if (response->type == WorkerResponseType::ERROR) {
            LogPrintWorker(WARN, "Task %s (%s) failed: %s", task_id.c_str(),
                           WorkerMessageTypeName(task.message.type).c_str(), response->error.c_str());
            task.promise.set_exception(std::make_exception_ptr(WorkerFailure(response->error)));
            FinishTask(elapsed, false);
        } else {
            task.promise.set_value(std::move(*response));
            FinishTask(elapsed, true);
        }
    }

    LogPrintWorker(DEBUG, "Worker %zu stopped", slot);
}

} // namespace art_dna
