/// @file event_manager.cpp
/// @brief EventManager implementation

#include <hark/event/event_manager.hpp>
#include <hark/core/log.hpp>

#include <exception>

namespace hark_event {

// =============================================================================
// Constructors
// =============================================================================

EventManager::EventManager()
    : EventManager(hark_core::ManagerConfig::defaults()) {}

EventManager::EventManager(hark_core::ManagerConfig config)
    : m_config(std::move(config))
    , m_registry(std::make_shared<SubscriptionRegistry>()) {
    if (!m_config.log_level) {
        return;
    }

    auto logger = hark_core::event_logger();
    if (auto level = hark_core::parse_log_level(*m_config.log_level)) {
        hark_core::set_logger_level(logger->name(), *level);
    } else {
        logger->warn("Unknown log level '{}', keeping {}", *m_config.log_level,
            hark_core::log_level_name(logger->level()));
    }
}

EventManager::~EventManager() {
    shutdown();
}

// =============================================================================
// Registration
// =============================================================================

SubscriptionGuard EventManager::register_subscription(
    SubscriptionKind kind, std::string event_name, Predicate predicate) {
    std::shared_ptr<Subscription> subscription;
    switch (kind) {
        case SubscriptionKind::OneShot:
            subscription = std::make_shared<OneShotWaiter>(std::move(event_name), std::move(predicate));
            break;
        case SubscriptionKind::Streaming:
            subscription = std::make_shared<StreamingWaiter>(std::move(event_name), std::move(predicate));
            break;
    }
    return attach(std::move(subscription));
}

bool EventManager::deregister(SubscriptionId id) {
    bool removed = m_registry->remove(id);
    if (removed) {
        hark_core::event_logger()->trace("Deregistered subscription #{}", id.id);
    }
    return removed;
}

SubscriptionGuard EventManager::attach(std::shared_ptr<Subscription> subscription) {
    auto id = m_registry->add(subscription);
    if (!id.is_valid()) {
        return SubscriptionGuard{};
    }

    hark_core::event_logger()->trace("Registered {} subscription #{} for '{}'",
        subscription_kind_name(subscription->kind()), id.id, subscription->event_name());
    return SubscriptionGuard(m_registry, id, std::move(subscription));
}

// =============================================================================
// Dispatch
// =============================================================================

std::size_t EventManager::dispatch(const std::string& event_name, const Args& args) {
    auto subscriptions = m_registry->snapshot();

    std::size_t accepted = 0;
    for (const auto& subscription : subscriptions) {
        try {
            if (subscription->process(event_name, args)) {
                ++accepted;
            }
        } catch (const std::exception& e) {
            // A throwing predicate counts as a rejection for that subscription only
            hark_core::event_logger()->error("Predicate for '{}' threw: {}", event_name, e.what());
        } catch (...) {
            hark_core::event_logger()->error("Predicate for '{}' threw a non-standard exception", event_name);
        }
    }

    hark_core::event_logger()->trace("Dispatched '{}' to {} of {} subscription(s)",
        event_name, accepted, subscriptions.size());
    return accepted;
}

// =============================================================================
// Waiting
// =============================================================================

hark_core::Result<Args> EventManager::wait_for(
    const std::string& event_name, Predicate predicate, std::optional<Duration> timeout) {
    auto waiter = std::make_shared<OneShotWaiter>(event_name, std::move(predicate));
    auto guard = attach(waiter);
    if (!guard.active()) {
        return hark_core::Err<Args>(hark_core::WaitError::cancelled(event_name));
    }

    std::optional<Clock::time_point> deadline;
    if (timeout) {
        deadline = hark_core::deadline_after(Clock::now(), *timeout);
    }

    auto result = waiter->wait(deadline);
    guard.release();

    if (!result) {
        hark_core::debug::record_error(result.error());
        hark_core::event_logger()->debug("wait_for('{}') failed: {}", event_name,
            hark_core::build_error_chain(result.error()));
    }
    return result;
}

hark_core::Result<Args> EventManager::wait_for(const std::string& event_name, Predicate predicate) {
    return wait_for(event_name, std::move(predicate), m_config.default_wait_timeout);
}

EventStream EventManager::loop_for(
    const std::string& event_name,
    Predicate predicate,
    std::optional<Duration> iteration_timeout,
    std::optional<Duration> loop_timeout) {
    auto waiter = std::make_shared<StreamingWaiter>(event_name, std::move(predicate));
    auto guard = attach(waiter);
    if (!guard.active()) {
        return EventStream::failed(hark_core::WaitError::cancelled(event_name));
    }

    return EventStream(std::move(waiter), std::move(guard), iteration_timeout, loop_timeout);
}

EventStream EventManager::loop_for(const std::string& event_name, Predicate predicate) {
    return loop_for(event_name, std::move(predicate),
        m_config.default_iteration_timeout, m_config.default_loop_timeout);
}

// =============================================================================
// Lifecycle
// =============================================================================

void EventManager::shutdown() {
    if (m_registry->is_closed()) {
        return;
    }

    auto live = m_registry->close();
    for (const auto& subscription : live) {
        subscription->cancel();
    }

    if (!live.empty()) {
        hark_core::event_logger()->info("Event manager shut down, cancelled {} waiter(s)", live.size());
    }
}

bool EventManager::is_shut_down() const {
    return m_registry->is_closed();
}

// =============================================================================
// Queries
// =============================================================================

std::size_t EventManager::subscription_count() const {
    return m_registry->size();
}

std::size_t EventManager::subscription_count(const std::string& event_name) const {
    return m_registry->count(event_name);
}

bool EventManager::is_registered(SubscriptionId id) const {
    return m_registry->contains(id);
}

} // namespace hark_event
