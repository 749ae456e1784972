#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hark_event

#include <cstdint>

namespace hark_event {

// Kinds and IDs
enum class SubscriptionKind : std::uint8_t;
struct SubscriptionId;

// Matching
class Matcher;
class Subscription;
class OneShotWaiter;
class StreamingWaiter;

// Registry
class SubscriptionRegistry;
class SubscriptionGuard;

// Manager
class EventStream;
class EventManager;

} // namespace hark_event
