// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mcpmux
{

/// @brief Unbounded multi-producer / multi-consumer queue used to publish lifecycle events.
///
/// Producers never block. After close(), push() is a no-op and receivers drain the
/// remaining events before receive() starts returning std::nullopt.
template <typename Event>
class EventChannel
{
  public:
    void push(Event event)
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return;
            _events.push_back(std::move(event));
        }
        _condition.notify_one();
    }

    /// @brief Waits up to @p timeout for the next event.
    /// @return The event, or std::nullopt on timeout or when the channel is closed and drained.
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> std::optional<Event>
    {
        auto lock = std::unique_lock(_mutex);
        _condition.wait_for(lock, timeout, [this] { return !_events.empty() || _closed; });
        if (_events.empty())
            return std::nullopt;

        auto event = std::move(_events.front());
        _events.pop_front();
        return event;
    }

    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _condition.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable _condition;
    std::deque<Event> _events;
    bool _closed = false;
};

} // namespace mcpmux
