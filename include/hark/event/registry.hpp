#pragma once

/// @file registry.hpp
/// @brief Live subscription registry and its RAII handle
///
/// SubscriptionRegistry keeps subscriptions in registration order. Every
/// mutation happens under one mutex; dispatch works on a snapshot so it never
/// holds the lock while running predicates.
///
/// SubscriptionGuard owns one registration and removes it when destroyed, so
/// a subscription is deregistered on every exit path of its owner.

#include "subscription.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace hark_event {

// =============================================================================
// SubscriptionRegistry
// =============================================================================

class SubscriptionRegistry {
public:
    SubscriptionRegistry() = default;

    // Non-copyable
    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /// Append a subscription
    /// @return New id, or an invalid id once the registry is closed
    [[nodiscard]] SubscriptionId add(std::shared_ptr<Subscription> subscription);

    /// Remove a subscription; removing an unknown id is a no-op
    /// @return true if this call removed it
    bool remove(SubscriptionId id);

    /// Copy of the live subscriptions in registration order
    [[nodiscard]] std::vector<std::shared_ptr<Subscription>> snapshot() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t count(const std::string& event_name) const;
    [[nodiscard]] bool contains(SubscriptionId id) const;

    /// Refuse further registrations and hand back everything still live
    std::vector<std::shared_ptr<Subscription>> close();

    [[nodiscard]] bool is_closed() const;

private:
    struct Entry {
        SubscriptionId id;
        std::shared_ptr<Subscription> subscription;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
    std::uint64_t m_next_id = 1;
    bool m_closed = false;
};

// =============================================================================
// SubscriptionGuard
// =============================================================================

/// Move-only owner of one registry entry
class SubscriptionGuard {
public:
    /// Inactive guard
    SubscriptionGuard() = default;

    SubscriptionGuard(std::weak_ptr<SubscriptionRegistry> registry,
                      SubscriptionId id,
                      std::shared_ptr<Subscription> subscription);

    ~SubscriptionGuard();

    // Non-copyable
    SubscriptionGuard(const SubscriptionGuard&) = delete;
    SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;

    // Movable
    SubscriptionGuard(SubscriptionGuard&& other) noexcept;
    SubscriptionGuard& operator=(SubscriptionGuard&& other) noexcept;

    /// Deregister now; safe to call repeatedly and after the registry is gone
    /// @return true if this call removed the entry
    bool release();

    [[nodiscard]] SubscriptionId id() const noexcept { return m_id; }

    /// True while the guard still owns a registration
    [[nodiscard]] bool active() const noexcept { return m_id.is_valid(); }

    [[nodiscard]] const std::shared_ptr<Subscription>& subscription() const noexcept { return m_subscription; }

    /// Typed access to the guarded subscription
    template<typename W>
    [[nodiscard]] std::shared_ptr<W> as() const {
        return std::dynamic_pointer_cast<W>(m_subscription);
    }

private:
    std::weak_ptr<SubscriptionRegistry> m_registry;
    SubscriptionId m_id;
    std::shared_ptr<Subscription> m_subscription;
};

} // namespace hark_event
