/// @file event_stream.cpp
/// @brief EventStream implementation

#include <hark/event/event_stream.hpp>
#include <hark/core/log.hpp>

#include <algorithm>

namespace hark_event {

namespace {

/// Smaller of two optional bounds; an absent bound never wins
std::optional<Duration> lowest_bound(std::optional<Duration> a, std::optional<Duration> b) {
    if (!a) return b;
    if (!b) return a;
    return std::min(*a, *b);
}

} // anonymous namespace

EventStream::EventStream(std::shared_ptr<StreamingWaiter> waiter,
                         SubscriptionGuard guard,
                         std::optional<Duration> iteration_timeout,
                         std::optional<Duration> loop_timeout)
    : m_event_name(waiter->event_name())
    , m_waiter(std::move(waiter))
    , m_guard(std::move(guard))
    , m_iteration_timeout(iteration_timeout)
    , m_remaining(loop_timeout) {}

EventStream EventStream::failed(hark_core::Error error) {
    EventStream stream;
    if (const auto* wait = error.as<hark_core::WaitError>()) {
        stream.m_event_name = wait->event_name;
    }
    stream.m_pending_error = std::move(error);
    stream.m_state = State::Finished;
    return stream;
}

hark_core::Result<std::optional<Args>> EventStream::next() {
    if (m_state == State::Finished) {
        if (m_pending_error) {
            hark_core::Error error = std::move(*m_pending_error);
            m_pending_error.reset();
            return hark_core::Err<std::optional<Args>>(std::move(error));
        }
        return std::optional<Args>{};
    }

    if (m_state == State::Waiting) {
        // Charge the previous step, consumer time included
        if (m_step_start) {
            if (m_remaining) {
                *m_remaining -= Clock::now() - *m_step_start;
                if (*m_remaining <= Duration::zero()) {
                    return end_normally();
                }
            }
            m_step_start.reset();
        }

        auto start = Clock::now();
        std::optional<Clock::time_point> deadline;
        if (auto bound = lowest_bound(m_remaining, m_iteration_timeout)) {
            deadline = hark_core::deadline_after(start, *bound);
        }

        auto item = m_waiter->take_next(deadline);
        if (item) {
            m_step_start = start;
            return std::optional<Args>(std::move(*item));
        }

        if (!item.error().is_wait(hark_core::WaitError::Kind::WaitTimeout)) {
            return end_with(item.error());
        }

        hark_core::event_logger()->debug("loop_for('{}') timed out, draining {} queued event(s)",
            m_event_name, m_waiter->pending());
        m_waiter->close();
        m_state = State::Draining;
    }

    // Draining: the waiter is closed so take_next never blocks
    auto item = m_waiter->take_next(std::nullopt);
    if (item) {
        return std::optional<Args>(std::move(*item));
    }
    if (item.error().is_wait(hark_core::WaitError::Kind::Cancelled)) {
        return end_with(item.error());
    }
    return end_with(hark_core::WaitError::loop_timeout(m_event_name));
}

void EventStream::stop() {
    m_state = State::Finished;
    m_pending_error.reset();
    m_guard.release();
}

hark_core::Result<std::optional<Args>> EventStream::end_normally() {
    hark_core::event_logger()->trace("loop_for('{}') budget spent, ending stream", m_event_name);
    stop();
    return std::optional<Args>{};
}

hark_core::Result<std::optional<Args>> EventStream::end_with(hark_core::Error error) {
    stop();
    hark_core::debug::record_error(error);
    return hark_core::Err<std::optional<Args>>(std::move(error));
}

} // namespace hark_event
