/// @file one_shot_waiter.cpp
/// @brief OneShotWaiter implementation

#include <hark/event/one_shot_waiter.hpp>

namespace hark_event {

OneShotWaiter::OneShotWaiter(std::string event_name, Predicate predicate)
    : m_matcher(std::move(event_name), std::move(predicate)) {}

bool OneShotWaiter::matches(const std::string& event_name, const Args& args) {
    if (!m_matcher.accepts_name(event_name)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_matcher.record(args);
    }
    return m_matcher.accepts_args(args);
}

bool OneShotWaiter::process(const std::string& event_name, const Args& args) {
    if (!m_matcher.accepts_name(event_name)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) {
            return false;
        }
        m_matcher.record(args);
    }

    // Predicate runs unlocked; it may dispatch back into this manager
    if (!m_matcher.accepts_args(args)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled) {
        return false;
    }
    if (!m_signaled) {
        m_signaled = true;
        m_result = args;
        m_cv.notify_all();
    }
    return true;
}

void OneShotWaiter::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = true;
    m_cv.notify_all();
}

hark_core::Result<Args> OneShotWaiter::wait(std::optional<Clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this] { return m_signaled || m_cancelled; };

    if (deadline) {
        if (!m_cv.wait_until(lock, *deadline, ready)) {
            return hark_core::Err<Args>(hark_core::WaitError::wait_timeout(m_matcher.event_name()));
        }
    } else {
        m_cv.wait(lock, ready);
    }

    // A match that landed before the cancellation still wins
    if (m_signaled) {
        return *m_result;
    }
    return hark_core::Err<Args>(hark_core::WaitError::cancelled(m_matcher.event_name()));
}

bool OneShotWaiter::is_signaled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_signaled;
}

} // namespace hark_event
