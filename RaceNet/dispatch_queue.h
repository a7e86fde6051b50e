#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include "network_constants.h"

// FIFO of closures produced by receive threads and executed by the single consumer
// (the per-tick update). Only the queue itself is shared between threads.
class MainThreadDispatcher {
public:
    using Action = std::function<void()>;

    MainThreadDispatcher() = default;
    MainThreadDispatcher(const MainThreadDispatcher&) = delete;
    MainThreadDispatcher& operator=(const MainThreadDispatcher&) = delete;

    // Callable from any thread
    void Enqueue(Action action);

    // Consumer thread only. Runs at most maxItems closures; the rest wait for the next call.
    std::size_t Drain(std::size_t maxItems = NetworkConstants::MAX_DISPATCH_PER_TICK);

    std::size_t GetPendingCount() const;

    // Drops everything still queued without running it
    void Clear();

private:
    mutable std::mutex mutex;
    std::deque<Action> actions;
};
