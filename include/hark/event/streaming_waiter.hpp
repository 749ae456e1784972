#pragma once

/// @file streaming_waiter.hpp
/// @brief Buffering subscription backing EventManager::loop_for
///
/// Matched events are appended to an unbounded FIFO. Closing the waiter stops
/// new arrivals but keeps the backlog, so a consumer can drain everything that
/// arrived before the close.

#include "subscription.hpp"
#include <hark/core/error.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace hark_event {

class StreamingWaiter final : public Subscription {
public:
    StreamingWaiter(std::string event_name, Predicate predicate);

    // Non-copyable, non-movable (shared through the registry)
    StreamingWaiter(const StreamingWaiter&) = delete;
    StreamingWaiter& operator=(const StreamingWaiter&) = delete;

    [[nodiscard]] const std::string& event_name() const noexcept override { return m_matcher.event_name(); }
    [[nodiscard]] SubscriptionKind kind() const noexcept override { return SubscriptionKind::Streaming; }

    [[nodiscard]] bool matches(const std::string& event_name, const Args& args) override;

    /// Queue the event if open and matching
    bool process(const std::string& event_name, const Args& args) override;

    /// Stop accepting events and wake the consumer; queued items stay
    void cancel() override;

    /// Pop the oldest item, suspending while the queue is empty and open
    /// @param deadline std::nullopt waits indefinitely
    /// @return Item, or Exhausted (closed and empty), WaitTimeout, Cancelled
    [[nodiscard]] hark_core::Result<Args> take_next(std::optional<Clock::time_point> deadline);

    /// Non-blocking pop
    [[nodiscard]] std::optional<Args> try_take();

    /// Stop accepting new events; does not touch queued items
    void close();

    [[nodiscard]] bool is_closed() const;

    /// Number of queued items
    [[nodiscard]] std::size_t pending() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    Matcher m_matcher;
    std::deque<Args> m_queue;
    bool m_closed = false;
    bool m_cancelled = false;
};

} // namespace hark_event
