#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "dispatch_queue.h"

TEST_CASE("Drain runs at most the requested number of closures in FIFO order") {
    MainThreadDispatcher dispatcher;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        dispatcher.Enqueue([&order, i]() { order.push_back(i); });
    }

    REQUIRE(dispatcher.Drain(3) == 3);
    REQUIRE(order == std::vector<int>{ 0, 1, 2 });
    REQUIRE(dispatcher.GetPendingCount() == 2);

    REQUIRE(dispatcher.Drain(3) == 2);
    REQUIRE(order == std::vector<int>{ 0, 1, 2, 3, 4 });
    REQUIRE(dispatcher.GetPendingCount() == 0);
}

TEST_CASE("Drain on an empty queue does nothing") {
    MainThreadDispatcher dispatcher;
    REQUIRE(dispatcher.Drain() == 0);
}

TEST_CASE("Empty actions are not queued") {
    MainThreadDispatcher dispatcher;
    dispatcher.Enqueue(MainThreadDispatcher::Action());
    REQUIRE(dispatcher.GetPendingCount() == 0);
}

TEST_CASE("A throwing closure does not stop the rest of the batch") {
    MainThreadDispatcher dispatcher;
    int ran = 0;
    dispatcher.Enqueue([&ran]() { ++ran; });
    dispatcher.Enqueue([]() { throw std::runtime_error("boom"); });
    dispatcher.Enqueue([&ran]() { ++ran; });

    REQUIRE(dispatcher.Drain() == 3);
    REQUIRE(ran == 2);
}

TEST_CASE("Work enqueued by a closure waits for the next Drain") {
    MainThreadDispatcher dispatcher;
    int followUps = 0;
    dispatcher.Enqueue([&]() {
        dispatcher.Enqueue([&followUps]() { ++followUps; });
    });

    REQUIRE(dispatcher.Drain() == 1);
    REQUIRE(followUps == 0);
    REQUIRE(dispatcher.Drain() == 1);
    REQUIRE(followUps == 1);
}

TEST_CASE("Clear drops queued work without running it") {
    MainThreadDispatcher dispatcher;
    bool ran = false;
    dispatcher.Enqueue([&ran]() { ran = true; });
    dispatcher.Clear();

    REQUIRE(dispatcher.Drain() == 0);
    REQUIRE_FALSE(ran);
}

TEST_CASE("Closures from several producer threads are all delivered") {
    MainThreadDispatcher dispatcher;
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 250;
    int executed = 0;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&dispatcher, &executed]() {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                dispatcher.Enqueue([&executed]() { ++executed; });
            }
        });
    }

    std::size_t drained = 0;
    while (drained < PRODUCERS * PER_PRODUCER) {
        drained += dispatcher.Drain(100);
        std::this_thread::yield();
    }
    for (std::thread& producer : producers) {
        producer.join();
    }

    REQUIRE(executed == PRODUCERS * PER_PRODUCER);
    REQUIRE(dispatcher.GetPendingCount() == 0);
}
