#include <catch2/catch.hpp>

#include "core/signal.h"
#include "core/task_queue.h"

#include <atomic>
#include <stdexcept>

TEST_CASE("Worker pool runs queued jobs before shutting down", "[tasks]")
{
    std::atomic<int> ran{0};
    lingua::WorkerPool pool(2);
    for (int i = 0; i < 50; ++i)
        REQUIRE(pool.Post([&]() { ++ran; }));
    pool.Shutdown();
    REQUIRE(ran == 50);
    REQUIRE_FALSE(pool.Post([]() {}));
}

TEST_CASE("A throwing job does not take the worker down", "[tasks]")
{
    std::atomic<int> ran{0};
    lingua::WorkerPool pool(1);
    pool.Post([]() { throw std::runtime_error("boom"); });
    pool.Post([&]() { ++ran; });
    pool.Shutdown();
    REQUIRE(ran == 1);
}

TEST_CASE("Completions run on the draining thread in order", "[tasks]")
{
    lingua::CompletionQueue q;
    std::vector<int> order;

    lingua::WorkerPool pool(1);
    pool.Post([&]()
    {
        q.Push([&]() { order.push_back(1); });
        q.Push([&]() { order.push_back(2); });
    });
    pool.Shutdown();

    REQUIRE(q.Pending() == 2);
    REQUIRE(q.WaitAndDrain(std::chrono::milliseconds(100)) == 2);
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE(q.WaitAndDrain(std::chrono::milliseconds(1)) == 0);
}

TEST_CASE("Signals reach connected slots only", "[tasks]")
{
    lingua::Signal<int> sig;
    int a = 0, b = 0;
    const auto ca = sig.Connect([&](int v) { a += v; });
    sig.Emit(1);
    sig.Connect([&](int v) { b += v; });
    sig.Emit(2);
    REQUIRE(sig.Disconnect(ca));
    sig.Emit(4);

    REQUIRE(a == 3);
    REQUIRE(b == 6);
    REQUIRE(sig.Size() == 1);
}
