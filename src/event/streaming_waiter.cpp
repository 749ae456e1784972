/// @file streaming_waiter.cpp
/// @brief StreamingWaiter implementation

#include <hark/event/streaming_waiter.hpp>

namespace hark_event {

StreamingWaiter::StreamingWaiter(std::string event_name, Predicate predicate)
    : m_matcher(std::move(event_name), std::move(predicate)) {}

bool StreamingWaiter::matches(const std::string& event_name, const Args& args) {
    if (!m_matcher.accepts_name(event_name)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_matcher.record(args);
    }
    return m_matcher.accepts_args(args);
}

bool StreamingWaiter::process(const std::string& event_name, const Args& args) {
    if (!m_matcher.accepts_name(event_name)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        m_matcher.record(args);
    }

    // Predicate runs unlocked; it may dispatch back into this manager
    if (!m_matcher.accepts_args(args)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return false;
    }

    bool was_empty = m_queue.empty();
    m_queue.push_back(args);

    // Single consumer: only the empty -> non-empty edge needs a wakeup
    if (was_empty) {
        m_cv.notify_all();
    }
    return true;
}

void StreamingWaiter::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = true;
    m_closed = true;
    m_cv.notify_all();
}

hark_core::Result<Args> StreamingWaiter::take_next(std::optional<Clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this] { return !m_queue.empty() || m_closed; };

    if (deadline) {
        if (!m_cv.wait_until(lock, *deadline, ready)) {
            return hark_core::Err<Args>(hark_core::WaitError::wait_timeout(m_matcher.event_name()));
        }
    } else {
        m_cv.wait(lock, ready);
    }

    if (!m_queue.empty()) {
        Args item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

    if (m_cancelled) {
        return hark_core::Err<Args>(hark_core::WaitError::cancelled(m_matcher.event_name()));
    }
    return hark_core::Err<Args>(hark_core::WaitError::exhausted(m_matcher.event_name()));
}

std::optional<Args> StreamingWaiter::try_take() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) {
        return std::nullopt;
    }
    Args item = std::move(m_queue.front());
    m_queue.pop_front();
    return item;
}

void StreamingWaiter::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_cv.notify_all();
}

bool StreamingWaiter::is_closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t StreamingWaiter::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

} // namespace hark_event
