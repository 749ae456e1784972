#pragma once

/// @file one_shot_waiter.hpp
/// @brief Single-fire subscription backing EventManager::wait_for

#include "subscription.hpp"
#include <hark/core/error.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>

namespace hark_event {

/// Subscription that resumes exactly one suspended caller
///
/// The first matching event raises the signal and fixes the result; later
/// matches leave both untouched.
class OneShotWaiter final : public Subscription {
public:
    OneShotWaiter(std::string event_name, Predicate predicate);

    // Non-copyable, non-movable (shared through the registry)
    OneShotWaiter(const OneShotWaiter&) = delete;
    OneShotWaiter& operator=(const OneShotWaiter&) = delete;

    [[nodiscard]] const std::string& event_name() const noexcept override { return m_matcher.event_name(); }
    [[nodiscard]] SubscriptionKind kind() const noexcept override { return SubscriptionKind::OneShot; }

    [[nodiscard]] bool matches(const std::string& event_name, const Args& args) override;
    bool process(const std::string& event_name, const Args& args) override;
    void cancel() override;

    /// Block until the signal is raised, the waiter is cancelled, or the deadline passes
    /// @param deadline std::nullopt waits indefinitely
    /// @return Arguments of the first match, WaitTimeout or Cancelled
    [[nodiscard]] hark_core::Result<Args> wait(std::optional<Clock::time_point> deadline);

    [[nodiscard]] bool is_signaled() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    Matcher m_matcher;
    std::optional<Args> m_result;
    bool m_signaled = false;
    bool m_cancelled = false;
};

} // namespace hark_event
