#include "dispatch_queue.h"
#include "utils.h"
#include <algorithm>
#include <exception>
#include <vector>

void MainThreadDispatcher::Enqueue(Action action) {
    if (!action) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    actions.push_back(std::move(action));
}

/**
 * Executes queued closures on the calling (consumer) thread.
 * Items are moved out under the lock and run without it, so closures may
 * enqueue follow-up work; that work runs on a later Drain.
 * @param maxItems Upper bound on closures executed by this call.
 * @return Number of closures executed.
 */
std::size_t MainThreadDispatcher::Drain(std::size_t maxItems) {
    std::vector<Action> batch;
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t count = std::min(maxItems, actions.size());
        batch.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(actions.front()));
            actions.pop_front();
        }
    }

    for (Action& action : batch) {
        try {
            action();
        }
        catch (const std::exception& e) {
            Utils::printMsg("Exception in dispatched action: " + std::string(e.what()), error);
        }
    }

    return batch.size();
}

std::size_t MainThreadDispatcher::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return actions.size();
}

void MainThreadDispatcher::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    actions.clear();
}
