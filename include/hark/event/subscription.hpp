#pragma once

/// @file subscription.hpp
/// @brief Matching contract shared by every hark_event waiter
///
/// Matcher holds the single matching rule: strict name equality, then the
/// optional predicate. Subscription is the interface the EventManager drives;
/// each waiter kind composes its own Matcher rather than sharing mutable state.

#include "types.hpp"

#include <optional>
#include <string>

namespace hark_event {

// =============================================================================
// Matcher
// =============================================================================

/// Name + predicate filter that records the arguments it evaluates
///
/// matches() runs both halves in one call. Waiters shared across threads call
/// accepts_name(), record() and accepts_args() separately so the caller's
/// predicate never runs under their lock.
class Matcher {
public:
    Matcher(std::string event_name, Predicate predicate);

    /// Check an event against this matcher
    ///
    /// A name mismatch returns false without touching any state. On a name
    /// match the arguments are stored as last_match_args() before the
    /// predicate runs, so they are also stored when the predicate rejects.
    /// Only read last_match_args() right after a true result.
    [[nodiscard]] bool matches(const std::string& event_name, const Args& args);

    /// Name half of the rule; reads only immutable state
    [[nodiscard]] bool accepts_name(const std::string& event_name) const noexcept {
        return m_event_name == event_name;
    }

    /// Predicate half of the rule; reads only immutable state
    [[nodiscard]] bool accepts_args(const Args& args) const;

    /// Store `args` as last_match_args()
    void record(const Args& args) { m_last_match_args = args; }

    [[nodiscard]] const std::string& event_name() const noexcept { return m_event_name; }
    [[nodiscard]] bool has_predicate() const noexcept { return static_cast<bool>(m_predicate); }

    /// Arguments of the most recent name match
    [[nodiscard]] const std::optional<Args>& last_match_args() const noexcept { return m_last_match_args; }

private:
    std::string m_event_name;
    Predicate m_predicate;
    std::optional<Args> m_last_match_args;
};

// =============================================================================
// Subscription
// =============================================================================

/// A registered interest in future events
class Subscription {
public:
    virtual ~Subscription() = default;

    /// Event name this subscription listens for
    [[nodiscard]] virtual const std::string& event_name() const noexcept = 0;

    /// Which waiter kind implements this subscription
    [[nodiscard]] virtual SubscriptionKind kind() const noexcept = 0;

    /// Evaluate the matching rule without delivering anything
    [[nodiscard]] virtual bool matches(const std::string& event_name, const Args& args) = 0;

    /// Offer a dispatched event; never blocks
    ///
    /// The predicate runs without any waiter lock held, so it may itself
    /// dispatch events.
    /// @return true if the event matched and was delivered
    virtual bool process(const std::string& event_name, const Args& args) = 0;

    /// Wake any suspended consumer with a cancellation
    virtual void cancel() = 0;
};

} // namespace hark_event
