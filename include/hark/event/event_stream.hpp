#pragma once

/// @file event_stream.hpp
/// @brief Lazy, finite sequence produced by EventManager::loop_for
///
/// Each call to next() waits for one item, bounded by the smaller of the
/// iteration timeout and the remaining loop budget. The time from the start of
/// a wait until the consumer asks for the following item is charged to the
/// loop budget; once the budget is spent the stream ends normally.
///
/// When a bounded wait expires the waiter is closed and the stream drains its
/// backlog, then fails with WaitError::LoopTimeout.
///
/// ```cpp
/// auto stream = manager.loop_for("on_message", {}, std::nullopt, 5s);
/// while (true) {
///     auto item = stream.next();
///     if (!item) break;              // LoopTimeout or Cancelled
///     if (!item->has_value()) break; // budget spent
///     handle(**item);
/// }
/// ```

#include "registry.hpp"
#include "streaming_waiter.hpp"
#include <hark/core/error.hpp>

#include <memory>
#include <optional>
#include <type_traits>

namespace hark_event {

class EventStream {
public:
    EventStream(std::shared_ptr<StreamingWaiter> waiter,
                SubscriptionGuard guard,
                std::optional<Duration> iteration_timeout,
                std::optional<Duration> loop_timeout);

    /// Stream that fails with the given error on its first next()
    [[nodiscard]] static EventStream failed(hark_core::Error error);

    // Non-copyable
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Movable
    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&&) noexcept = default;

    /// Advance the sequence
    /// @return Next item; std::nullopt once the stream has ended normally;
    ///         LoopTimeout after the backlog is drained, or Cancelled
    [[nodiscard]] hark_core::Result<std::optional<Args>> next();

    /// Consume until the stream terminates
    /// @param func Callable taking Args&; returning false stops early
    /// @return Ok on normal end or early stop, otherwise the terminal error
    template<typename F>
    hark_core::Result<void> for_each(F&& func) {
        while (true) {
            auto item = next();
            if (!item) {
                return hark_core::Err(item.error());
            }
            if (!item->has_value()) {
                return hark_core::Ok();
            }
            if constexpr (std::is_same_v<std::invoke_result_t<F&, Args&>, bool>) {
                if (!func(**item)) {
                    stop();
                    return hark_core::Ok();
                }
            } else {
                func(**item);
            }
        }
    }

    /// End the stream now and deregister its waiter
    void stop();

    [[nodiscard]] bool finished() const noexcept { return m_state == State::Finished; }
    [[nodiscard]] bool draining() const noexcept { return m_state == State::Draining; }

    /// Loop budget left as of the last accounting; std::nullopt when unbounded
    [[nodiscard]] std::optional<Duration> remaining_budget() const noexcept { return m_remaining; }

    [[nodiscard]] const std::string& event_name() const noexcept { return m_event_name; }

private:
    enum class State : std::uint8_t {
        Waiting,
        Draining,
        Finished,
    };

    EventStream() = default;

    hark_core::Result<std::optional<Args>> end_normally();
    hark_core::Result<std::optional<Args>> end_with(hark_core::Error error);

    std::string m_event_name;
    std::shared_ptr<StreamingWaiter> m_waiter;
    SubscriptionGuard m_guard;
    std::optional<Duration> m_iteration_timeout;
    std::optional<Duration> m_remaining;
    std::optional<Clock::time_point> m_step_start;
    std::optional<hark_core::Error> m_pending_error;
    State m_state = State::Waiting;
};

} // namespace hark_event
