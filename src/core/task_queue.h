#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lingua
{

using Task = std::function<void()>;

// Background threads draining a FIFO job queue.
//
// Shutdown() stops accepting work, lets the workers finish every job already
// queued (so disk writes are never abandoned half way) and joins them.
class WorkerPool
{
public:
    explicit WorkerPool(size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once Shutdown() has started.
    bool Post(Task task);

    void Shutdown();

    size_t ThreadCount() const { return workers_.size(); }

private:
    void Run();

    std::vector<std::thread> workers_;
    std::mutex               mu_;
    std::condition_variable  cv_;
    std::deque<Task>         jobs_;
    bool                     running_ = true;
};

// Thread-safe inbox of completions, drained by its owner on one consistent
// thread (the "completion context"). Producers Push from any thread.
class CompletionQueue
{
public:
    void Push(Task task);

    // Runs every queued completion on the calling thread. Returns how many ran.
    size_t Drain();

    // Blocks until at least one completion is queued (or the timeout expires),
    // then drains. Returns how many ran.
    size_t WaitAndDrain(std::chrono::milliseconds timeout);

    size_t Pending() const;

private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Task>        queue_;
};

} // namespace lingua
