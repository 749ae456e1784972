/// @file registry.cpp
/// @brief SubscriptionRegistry and SubscriptionGuard implementation

#include <hark/event/registry.hpp>

#include <algorithm>
#include <utility>

namespace hark_event {

// =============================================================================
// SubscriptionRegistry
// =============================================================================

SubscriptionId SubscriptionRegistry::add(std::shared_ptr<Subscription> subscription) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_closed || !subscription) {
        return SubscriptionId{};
    }

    SubscriptionId id(m_next_id++);
    m_entries.push_back(Entry{id, std::move(subscription)});
    return id;
}

bool SubscriptionRegistry::remove(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [id](const Entry& entry) { return entry.id == id; });
    if (it == m_entries.end()) {
        return false;
    }

    m_entries.erase(it);
    return true;
}

std::vector<std::shared_ptr<Subscription>> SubscriptionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::shared_ptr<Subscription>> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.subscription);
    }
    return result;
}

std::size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t SubscriptionRegistry::count(const std::string& event_name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [&event_name](const Entry& entry) {
            return entry.subscription->event_name() == event_name;
        }));
}

bool SubscriptionRegistry::contains(SubscriptionId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entries.begin(), m_entries.end(),
        [id](const Entry& entry) { return entry.id == id; });
}

std::vector<std::shared_ptr<Subscription>> SubscriptionRegistry::close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_closed = true;

    std::vector<std::shared_ptr<Subscription>> live;
    live.reserve(m_entries.size());
    for (auto& entry : m_entries) {
        live.push_back(std::move(entry.subscription));
    }
    m_entries.clear();
    return live;
}

bool SubscriptionRegistry::is_closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

// =============================================================================
// SubscriptionGuard
// =============================================================================

SubscriptionGuard::SubscriptionGuard(std::weak_ptr<SubscriptionRegistry> registry,
                                     SubscriptionId id,
                                     std::shared_ptr<Subscription> subscription)
    : m_registry(std::move(registry))
    , m_id(id)
    , m_subscription(std::move(subscription)) {}

SubscriptionGuard::~SubscriptionGuard() {
    release();
}

SubscriptionGuard::SubscriptionGuard(SubscriptionGuard&& other) noexcept
    : m_registry(std::move(other.m_registry))
    , m_id(std::exchange(other.m_id, SubscriptionId{}))
    , m_subscription(std::move(other.m_subscription)) {}

SubscriptionGuard& SubscriptionGuard::operator=(SubscriptionGuard&& other) noexcept {
    if (this != &other) {
        release();
        m_registry = std::move(other.m_registry);
        m_id = std::exchange(other.m_id, SubscriptionId{});
        m_subscription = std::move(other.m_subscription);
    }
    return *this;
}

bool SubscriptionGuard::release() {
    if (!m_id.is_valid()) {
        return false;
    }

    SubscriptionId id = std::exchange(m_id, SubscriptionId{});
    if (auto registry = m_registry.lock()) {
        return registry->remove(id);
    }
    return false;
}

} // namespace hark_event
