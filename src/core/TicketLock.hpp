// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace toolbridge
{

/// @brief A fair mutex: threads acquire ownership in the order they called lock().
///
/// Satisfies BasicLockable, so it works with std::lock_guard and std::unique_lock.
class TicketLock
{
  public:
    TicketLock() = default;
    TicketLock(const TicketLock&) = delete;
    TicketLock& operator=(const TicketLock&) = delete;

    void lock()
    {
        auto guard = std::unique_lock(_mutex);
        auto const ticket = _nextTicket++;
        _turn.wait(guard, [&] { return _nowServing == ticket; });
    }

    void unlock()
    {
        {
            auto const guard = std::lock_guard(_mutex);
            ++_nowServing;
        }
        _turn.notify_all();
    }

    /// @brief Number of threads currently holding or waiting for the lock.
    [[nodiscard]] auto contention() -> std::uint64_t
    {
        auto const guard = std::lock_guard(_mutex);
        return _nextTicket - _nowServing;
    }

  private:
    std::mutex _mutex;
    std::condition_variable _turn;
    std::uint64_t _nextTicket = 0;
    std::uint64_t _nowServing = 0;
};

} // namespace toolbridge
