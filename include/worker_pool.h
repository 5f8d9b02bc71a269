/**
 * @file worker_pool.h
 * @brief Fixed pool of worker threads fed one job at a time by an owner thread
 *
 * The owner decides which worker gets which job (it keeps the assignment
 * table); each worker holds at most one job in its inbox. Finished jobs,
 * successful or not, come back through a shared completion queue that the
 * owner drains without blocking.
 *
 * THREAD SAFETY:
 * - assign()/takeCompleted() are called from the owner thread only
 * - Each inbox is guarded by its own mutex + condition variable
 * - The completion queue is guarded by a single mutex
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "logger.h"

template<typename Job, typename Result>
class WorkerPool {
public:
    using Handler = std::function<Result(const Job&)>;

    /**
     * @brief A finished job: either a result or the error that aborted it
     */
    struct Completion {
        int workerId = -1;
        Job job;
        std::optional<Result> result;
        std::string error;       ///< Set when result is empty
    };

    explicit WorkerPool(Handler handler) : m_handler(std::move(handler)) {}

    ~WorkerPool() { stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Spawns the worker threads
     */
    void start(int numWorkers) {
        if (m_running.load()) {
            Logger::warning() << "WorkerPool already running";
            return;
        }

        m_running.store(true);
        m_slots.clear();
        for (int i = 0; i < numWorkers; ++i) {
            m_slots.push_back(std::make_unique<Slot>());
        }
        for (int i = 0; i < numWorkers; ++i) {
            m_slots[i]->thread = std::thread(&WorkerPool::workerLoop, this, i);
        }
    }

    /**
     * @brief Signals every worker to exit and joins them
     *
     * A job already running finishes first; its completion is still queued.
     * Safe to call multiple times.
     */
    void stop() {
        if (!m_running.exchange(false)) {
            return;
        }

        for (auto& slot : m_slots) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->cv.notify_all();
        }
        for (auto& slot : m_slots) {
            if (slot->thread.joinable()) {
                slot->thread.join();
            }
        }
        m_slots.clear();
    }

    bool isRunning() const { return m_running.load(); }
    int size() const { return static_cast<int>(m_slots.size()); }

    /**
     * @brief Hands a job to a worker the owner knows to be idle
     * @return False if the pool is stopped or the worker still holds a job
     */
    bool assign(int workerId, Job job) {
        if (!m_running.load() || workerId < 0 || workerId >= size()) {
            return false;
        }

        Slot& slot = *m_slots[workerId];
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if (slot.inbox.has_value()) {
                return false;
            }
            slot.inbox = std::move(job);
        }
        slot.cv.notify_one();
        return true;
    }

    /**
     * @brief Removes and returns every completion queued so far (never blocks)
     */
    std::vector<Completion> takeCompleted() {
        std::lock_guard<std::mutex> lock(m_completedMutex);
        std::vector<Completion> out;
        out.swap(m_completed);
        return out;
    }

    /**
     * @brief Blocks until at least one completion is queued or the timeout expires
     */
    bool waitForCompletion(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_completedMutex);
        return m_completedCV.wait_for(lock, timeout, [this]() { return !m_completed.empty(); });
    }

private:
    struct Slot {
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Job> inbox;
    };

    void workerLoop(int workerId) {
        Slot& slot = *m_slots[workerId];

        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(slot.mutex);
                slot.cv.wait(lock, [&]() { return slot.inbox.has_value() || !m_running.load(); });
                if (!slot.inbox.has_value()) {
                    break;
                }
                job = std::move(*slot.inbox);
            }

            Completion completion;
            completion.workerId = workerId;
            try {
                completion.result = m_handler(job);
            } catch (const std::exception& e) {
                completion.error = e.what();
            }
            completion.job = std::move(job);

            // The inbox is emptied before the completion is published: the
            // owner only reassigns a worker after draining its completion
            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                slot.inbox.reset();
            }
            {
                std::lock_guard<std::mutex> completedLock(m_completedMutex);
                m_completed.push_back(std::move(completion));
            }
            m_completedCV.notify_all();
        }
    }

    Handler m_handler;
    std::atomic<bool> m_running{false};
    std::vector<std::unique_ptr<Slot>> m_slots;

    std::vector<Completion> m_completed;
    std::mutex m_completedMutex;
    std::condition_variable m_completedCV;
};
