/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/DeferredTaskQueue.hpp"
#include "core/Logger.hpp"
#include <exception>

namespace Strata {

void DeferredTaskQueue::enqueue(std::string label, Task task)
{
    if (!task) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.push_back(PendingTask{std::move(label), std::move(task)});
}

void DeferredTaskQueue::beginBatch()
{
    ++m_batchDepth;
}

size_t DeferredTaskQueue::endBatch()
{
    if (m_batchDepth == 0) {
        LIFECYCLE_WARN("endBatch() called without a matching beginBatch()");
        return 0;
    }
    if (--m_batchDepth > 0) {
        return 0;
    }
    return drain();
}

size_t DeferredTaskQueue::drain()
{
    std::deque<PendingTask> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_pending);
    }

    size_t ran = 0;
    for (auto& pending : batch) {
        try {
            pending.task();
        } catch (const std::exception& e) {
            LIFECYCLE_ERROR("Deferred task '" + pending.label + "' failed: " + e.what());
        }
        ++ran;
    }
    return ran;
}

size_t DeferredTaskQueue::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

} // namespace Strata
