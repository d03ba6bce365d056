// SPDX-License-Identifier: Apache-2.0
#include "WorkerPool.hpp"

#include <algorithm>

namespace toolbridge
{

WorkerPool::WorkerPool(std::size_t threadCount)
{
    auto const count = std::max<std::size_t>(threadCount, 1);
    _workers.reserve(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _workers.emplace_back([this](const std::stop_token& token) { run(token); });
}

WorkerPool::~WorkerPool()
{
    for (auto& worker: _workers)
        worker.request_stop();
    _cv.notify_all();
    _workers.clear();
}

auto WorkerPool::threadCount() const -> std::size_t
{
    return _workers.size();
}

auto WorkerPool::defaultThreadCount() -> std::size_t
{
    return std::max<std::size_t>(4, std::thread::hardware_concurrency());
}

void WorkerPool::enqueue(std::function<void()> job)
{
    {
        auto const lock = std::lock_guard(_mutex);
        _queue.push_back(std::move(job));
    }
    _cv.notify_one();
}

void WorkerPool::run(const std::stop_token& stopToken)
{
    while (true)
    {
        auto job = std::function<void()> {};
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, stopToken, [this] { return !_queue.empty(); });

            // Drain what is left before honoring a stop request.
            if (_queue.empty())
                return;

            job = std::move(_queue.front());
            _queue.pop_front();
        }

        job();
    }
}

} // namespace toolbridge
