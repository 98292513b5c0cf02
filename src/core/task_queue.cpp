#include "core/task_queue.h"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lingua
{

WorkerPool::WorkerPool(size_t threads)
{
    threads = std::max<size_t>(1, threads);
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i)
        workers_.emplace_back([this]() { Run(); });
}

WorkerPool::~WorkerPool()
{
    Shutdown();
}

bool WorkerPool::Post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_)
            return false;
        jobs_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_ && workers_.empty())
            return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : workers_)
    {
        if (t.joinable())
            t.join();
    }
    workers_.clear();
}

void WorkerPool::Run()
{
    for (;;)
    {
        Task job;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&]() { return !running_ || !jobs_.empty(); });
            if (jobs_.empty())
                return; // stopped and drained
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try
        {
            job();
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "[worker] job threw: %s\n", e.what());
        }
    }
}

void CompletionQueue::Push(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.push_back(std::move(task));
    }
    cv_.notify_all();
}

size_t CompletionQueue::Drain()
{
    size_t ran = 0;
    for (;;)
    {
        Task t;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (queue_.empty())
                return ran;
            t = std::move(queue_.front());
            queue_.pop_front();
        }
        t();
        ++ran;
    }
}

size_t CompletionQueue::WaitAndDrain(std::chrono::milliseconds timeout)
{
    {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, timeout, [&]() { return !queue_.empty(); });
    }
    return Drain();
}

size_t CompletionQueue::Pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

} // namespace lingua
