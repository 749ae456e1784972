#pragma once

/// @file event.hpp
/// @brief Main include header for hark_event
///
/// hark_event lets call sites suspend until an externally delivered event
/// matching a name and predicate occurs:
/// - wait_for: one match, with an optional timeout
/// - loop_for: a bounded-lifetime stream of matches with per-iteration and
///   overall timeouts
///
/// ## Quick Start
///
/// ```cpp
/// hark_event::EventManager manager;
///
/// // Event source thread
/// manager.emit("on_ready", std::string("session-1"));
///
/// // Caller: one match
/// auto ready = manager.wait_for("on_ready", {}, std::chrono::seconds(5));
/// if (ready) {
///     auto* session = hark_event::arg_as<std::string>(*ready, 0);
/// }
///
/// // Caller: stream of matches for up to 10 seconds
/// auto stream = manager.loop_for("on_message", {}, std::nullopt, std::chrono::seconds(10));
/// auto done = stream.for_each([](hark_event::Args& args) {
///     // Handle args
/// });
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "subscription.hpp"
#include "one_shot_waiter.hpp"
#include "streaming_waiter.hpp"
#include "registry.hpp"
#include "event_stream.hpp"
#include "event_manager.hpp"

namespace hark_event {

/// Prelude - commonly used types
namespace prelude {
    using hark_event::Args;
    using hark_event::Predicate;
    using hark_event::SubscriptionId;
    using hark_event::SubscriptionGuard;
    using hark_event::EventStream;
    using hark_event::EventManager;
} // namespace prelude

} // namespace hark_event
