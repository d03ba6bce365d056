// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace toolbridge
{

/// @brief Bounded pool of worker threads executing queued jobs in FIFO order.
///
/// Blocking work (process spawns, handshakes, tool calls) runs here so the caller can
/// await many providers at once. Jobs still queued at destruction are run before the
/// workers exit, so every future obtained from submit() becomes ready.
class WorkerPool
{
  public:
    /// @brief Starts the given number of worker threads (at least one).
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Queues a callable and returns a future for its result.
    template <typename F>
    [[nodiscard]] auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    /// @brief Returns the number of worker threads.
    [[nodiscard]] auto threadCount() const -> std::size_t;

    /// @brief Returns a sensible default size for the pool on this machine.
    [[nodiscard]] static auto defaultThreadCount() -> std::size_t;

  private:
    void enqueue(std::function<void()> job);
    void run(const std::stop_token& stopToken);

    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<std::function<void()>> _queue;
    std::vector<std::jthread> _workers;
};

} // namespace toolbridge
