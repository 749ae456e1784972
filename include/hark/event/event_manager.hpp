#pragma once

/// @file event_manager.hpp
/// @brief Correlates externally delivered events with suspended callers
///
/// The event source calls dispatch() once per inbound notification. Callers
/// suspend in wait_for() until one matching event arrives, or consume a
/// bounded-lifetime stream of matches from loop_for(). Every waiter is
/// deregistered when the call (or stream) that created it ends, on every path.
///
/// One EventManager serves one client session; there is no global instance.
/// Guards and streams may outlive the manager: deregistration then becomes a
/// no-op.

#include "event_stream.hpp"
#include "one_shot_waiter.hpp"
#include "registry.hpp"
#include "streaming_waiter.hpp"
#include <hark/core/config.hpp>
#include <hark/core/error.hpp>

#include <memory>
#include <optional>
#include <string>

namespace hark_event {

class EventManager {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    EventManager();
    explicit EventManager(hark_core::ManagerConfig config);

    /// Cancels every live waiter
    ~EventManager();

    // Non-copyable, non-movable
    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;
    EventManager(EventManager&&) = delete;
    EventManager& operator=(EventManager&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Create and register a subscription of the requested kind
    /// @return Active guard, or an inactive guard after shutdown()
    [[nodiscard]] SubscriptionGuard register_subscription(
        SubscriptionKind kind, std::string event_name, Predicate predicate = {});

    /// Remove a subscription by id; unknown ids are ignored
    /// @return true if the subscription was still registered
    bool deregister(SubscriptionId id);

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Offer an event to every live subscription in registration order
    /// @return Number of subscriptions that accepted the event
    std::size_t dispatch(const std::string& event_name, const Args& args);

    /// Dispatch with the arguments packed from values
    template<typename... Ts>
    std::size_t emit(const std::string& event_name, Ts&&... values) {
        return dispatch(event_name, make_args(std::forward<Ts>(values)...));
    }

    // =========================================================================
    // Waiting
    // =========================================================================

    /// Suspend until one matching event arrives
    /// @param timeout std::nullopt waits indefinitely; zero expires immediately
    /// @return Arguments of the match, WaitTimeout or Cancelled
    [[nodiscard]] hark_core::Result<Args> wait_for(
        const std::string& event_name, Predicate predicate, std::optional<Duration> timeout);

    /// wait_for with the configured default timeout
    [[nodiscard]] hark_core::Result<Args> wait_for(
        const std::string& event_name, Predicate predicate = {});

    /// Stream matching events until the loop budget is spent or a wait expires
    /// @param iteration_timeout Bound on each individual wait
    /// @param loop_timeout Overall budget; std::nullopt never ends by budget
    [[nodiscard]] EventStream loop_for(
        const std::string& event_name,
        Predicate predicate,
        std::optional<Duration> iteration_timeout,
        std::optional<Duration> loop_timeout);

    /// loop_for with the configured default timeouts
    [[nodiscard]] EventStream loop_for(const std::string& event_name, Predicate predicate = {});

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Cancel every live waiter and refuse new ones
    void shutdown();

    [[nodiscard]] bool is_shut_down() const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t subscription_count() const;
    [[nodiscard]] std::size_t subscription_count(const std::string& event_name) const;
    [[nodiscard]] bool empty() const { return subscription_count() == 0; }
    [[nodiscard]] bool is_registered(SubscriptionId id) const;

    [[nodiscard]] const hark_core::ManagerConfig& config() const noexcept { return m_config; }

private:
    SubscriptionGuard attach(std::shared_ptr<Subscription> subscription);

    hark_core::ManagerConfig m_config;
    std::shared_ptr<SubscriptionRegistry> m_registry;
};

} // namespace hark_event
