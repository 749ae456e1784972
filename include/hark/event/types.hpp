#pragma once

/// @file types.hpp
/// @brief Shared value types for hark_event

#include "fwd.hpp"
#include <hark/core/config.hpp>

#include <any>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace hark_event {

using hark_core::Clock;
using hark_core::Duration;

/// Ordered tuple of opaque event arguments
using Args = std::vector<std::any>;

/// Caller-supplied filter; an empty function accepts every name match
using Predicate = std::function<bool(const Args&)>;

// =============================================================================
// SubscriptionKind
// =============================================================================

enum class SubscriptionKind : std::uint8_t {
    OneShot = 0,
    Streaming = 1,
};

[[nodiscard]] inline const char* subscription_kind_name(SubscriptionKind kind) {
    switch (kind) {
        case SubscriptionKind::OneShot: return "OneShot";
        case SubscriptionKind::Streaming: return "Streaming";
        default: return "Unknown";
    }
}

// =============================================================================
// SubscriptionId
// =============================================================================

/// Registry handle for a live subscription
struct SubscriptionId {
    std::uint64_t id = 0;

    constexpr SubscriptionId() = default;
    constexpr explicit SubscriptionId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriptionId&) const noexcept = default;
    constexpr bool operator==(const SubscriptionId&) const noexcept = default;
};

// =============================================================================
// Args helpers
// =============================================================================

/// Pack values into an Args tuple
template<typename... Ts>
[[nodiscard]] Args make_args(Ts&&... values) {
    Args args;
    args.reserve(sizeof...(Ts));
    (args.emplace_back(std::forward<Ts>(values)), ...);
    return args;
}

/// Typed view of one argument
/// @return Pointer to the value, nullptr if out of range or of another type
template<typename T>
[[nodiscard]] const T* arg_as(const Args& args, std::size_t index) {
    if (index >= args.size()) {
        return nullptr;
    }
    return std::any_cast<T>(&args[index]);
}

} // namespace hark_event
