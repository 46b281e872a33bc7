/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFERRED_TASK_QUEUE_HPP
#define DEFERRED_TASK_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace Strata {

/**
 * @brief Work the host postpones until its current batch of startup work
 * has finished.
 *
 * Tasks run on the thread that calls drain(), in the order they were
 * enqueued. A task enqueued while the queue drains waits for the next drain.
 */
class DeferredTaskQueue {
public:
    using Task = std::function<void()>;

    void enqueue(std::string label, Task task);

    void beginBatch();
    // Ends the batch and drains everything it postponed
    size_t endBatch();
    bool isBatchActive() const { return m_batchDepth > 0; }

    /**
     * @brief Runs every queued task. A task that throws is logged and the
     * remaining tasks still run.
     * @return number of tasks run
     */
    size_t drain();

    size_t getPendingCount() const;

private:
    struct PendingTask {
        std::string label;
        Task task;
    };

    mutable std::mutex m_mutex;
    std::deque<PendingTask> m_pending;
    int m_batchDepth{0};
};

} // namespace Strata

#endif // DEFERRED_TASK_QUEUE_HPP
