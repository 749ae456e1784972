/// @file test_waiters.cpp
/// @brief Tests for Matcher, OneShotWaiter and StreamingWaiter

#include <catch2/catch_test_macros.hpp>
#include <hark/event/event.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace hark_event;
using namespace std::chrono_literals;

namespace {

Predicate first_int_equals(int expected) {
    return [expected](const Args& args) {
        const int* value = arg_as<int>(args, 0);
        return value != nullptr && *value == expected;
    };
}

} // namespace

// =============================================================================
// Matcher
// =============================================================================

TEST_CASE("Matcher: name must match exactly", "[event][matcher]") {
    Matcher matcher("on_ready", {});

    REQUIRE_FALSE(matcher.matches("on_message", make_args(1)));
    REQUIRE_FALSE(matcher.matches("ON_READY", make_args(1)));
    REQUIRE_FALSE(matcher.last_match_args().has_value());

    REQUIRE(matcher.matches("on_ready", make_args(1)));
    REQUIRE(matcher.last_match_args().has_value());
}

TEST_CASE("Matcher: predicate decides after a name match", "[event][matcher]") {
    Matcher matcher("on_x", first_int_equals(7));
    REQUIRE(matcher.has_predicate());

    REQUIRE(matcher.matches("on_x", make_args(7)));
    REQUIRE_FALSE(matcher.matches("on_x", make_args(8)));
}

TEST_CASE("Matcher: arguments are recorded even when the predicate rejects", "[event][matcher]") {
    Matcher matcher("on_x", first_int_equals(7));

    REQUIRE_FALSE(matcher.matches("on_x", make_args(3)));
    REQUIRE(matcher.last_match_args().has_value());
    REQUIRE(*arg_as<int>(*matcher.last_match_args(), 0) == 3);
}

TEST_CASE("Matcher: no predicate accepts any name match", "[event][matcher]") {
    Matcher matcher("on_x", {});
    REQUIRE_FALSE(matcher.has_predicate());
    REQUIRE(matcher.matches("on_x", Args{}));
    REQUIRE(matcher.matches("on_x", make_args(std::string("payload"), 2.5)));
}

// =============================================================================
// OneShotWaiter
// =============================================================================

TEST_CASE("OneShotWaiter: non-matching events never signal", "[event][oneshot]") {
    OneShotWaiter waiter("on_ready", first_int_equals(1));

    REQUIRE_FALSE(waiter.process("on_other", make_args(1)));
    REQUIRE_FALSE(waiter.process("on_ready", make_args(2)));
    REQUIRE_FALSE(waiter.is_signaled());

    auto result = waiter.wait(Clock::now());
    REQUIRE(result.is_err());
    REQUIRE(result.error().is_wait(hark_core::WaitError::Kind::WaitTimeout));
}

TEST_CASE("OneShotWaiter: first match wins", "[event][oneshot]") {
    OneShotWaiter waiter("on_x", {});

    REQUIRE(waiter.process("on_x", make_args(1)));
    REQUIRE(waiter.is_signaled());

    // Raising again is a no-op and does not replace the result
    REQUIRE(waiter.process("on_x", make_args(2)));

    auto result = waiter.wait(std::nullopt);
    REQUIRE(result.is_ok());
    REQUIRE(*arg_as<int>(*result, 0) == 1);
}

TEST_CASE("OneShotWaiter: wakes a suspended thread", "[event][oneshot]") {
    OneShotWaiter waiter("on_x", {});

    std::thread source([&waiter] {
        std::this_thread::sleep_for(10ms);
        waiter.process("on_x", make_args(std::string("hello")));
    });

    auto result = waiter.wait(Clock::now() + 2s);
    source.join();

    REQUIRE(result.is_ok());
    REQUIRE(*arg_as<std::string>(*result, 0) == "hello");
}

TEST_CASE("OneShotWaiter: cancel wakes with Cancelled", "[event][oneshot]") {
    OneShotWaiter waiter("on_x", {});

    std::thread canceller([&waiter] {
        std::this_thread::sleep_for(10ms);
        waiter.cancel();
    });

    auto result = waiter.wait(std::nullopt);
    canceller.join();

    REQUIRE(result.is_err());
    REQUIRE(result.error().is_wait(hark_core::WaitError::Kind::Cancelled));

    // Cancelled waiters ignore later events
    REQUIRE_FALSE(waiter.process("on_x", make_args(1)));
}

// =============================================================================
// StreamingWaiter
// =============================================================================

TEST_CASE("StreamingWaiter: queues matches in order", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});

    REQUIRE(waiter.process("on_msg", make_args(1)));
    REQUIRE_FALSE(waiter.process("on_other", make_args(99)));
    REQUIRE(waiter.process("on_msg", make_args(2)));
    REQUIRE(waiter.pending() == 2);

    auto first = waiter.take_next(std::nullopt);
    auto second = waiter.take_next(std::nullopt);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    REQUIRE(*arg_as<int>(*first, 0) == 1);
    REQUIRE(*arg_as<int>(*second, 0) == 2);
    REQUIRE(waiter.pending() == 0);
}

TEST_CASE("StreamingWaiter: rejected predicate does not enqueue", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", first_int_equals(5));

    REQUIRE_FALSE(waiter.process("on_msg", make_args(4)));
    REQUIRE(waiter.pending() == 0);
    REQUIRE(waiter.process("on_msg", make_args(5)));
    REQUIRE(waiter.pending() == 1);
}

TEST_CASE("StreamingWaiter: empty and open times out at the deadline", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});

    auto start = Clock::now();
    auto result = waiter.take_next(start + 20ms);
    REQUIRE(result.is_err());
    REQUIRE(result.error().is_wait(hark_core::WaitError::Kind::WaitTimeout));
    REQUIRE(Clock::now() - start >= 20ms);
}

TEST_CASE("StreamingWaiter: suspends again after the queue empties", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});

    waiter.process("on_msg", make_args(1));
    REQUIRE(waiter.take_next(std::nullopt).is_ok());

    // Queue is empty again, so the next take must really wait
    auto result = waiter.take_next(Clock::now() + 10ms);
    REQUIRE(result.is_err());
    REQUIRE(result.error().is_wait(hark_core::WaitError::Kind::WaitTimeout));
}

TEST_CASE("StreamingWaiter: close drains then reports exhausted", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});

    waiter.process("on_msg", make_args(1));
    waiter.process("on_msg", make_args(2));
    waiter.close();
    REQUIRE(waiter.is_closed());

    // Closed waiters accept nothing new
    REQUIRE_FALSE(waiter.process("on_msg", make_args(3)));

    auto a = waiter.take_next(std::nullopt);
    auto b = waiter.take_next(std::nullopt);
    auto c = waiter.take_next(std::nullopt);

    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(*arg_as<int>(*a, 0) == 1);
    REQUIRE(*arg_as<int>(*b, 0) == 2);
    REQUIRE(c.is_err());
    REQUIRE(c.error().is_wait(hark_core::WaitError::Kind::Exhausted));
}

TEST_CASE("StreamingWaiter: wakes a suspended consumer", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});

    std::thread source([&waiter] {
        std::this_thread::sleep_for(10ms);
        waiter.process("on_msg", make_args(42));
    });

    auto result = waiter.take_next(Clock::now() + 2s);
    source.join();

    REQUIRE(result.is_ok());
    REQUIRE(*arg_as<int>(*result, 0) == 42);
}

TEST_CASE("StreamingWaiter: try_take never blocks", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});
    REQUIRE_FALSE(waiter.try_take().has_value());

    waiter.process("on_msg", make_args(1));
    auto item = waiter.try_take();
    REQUIRE(item.has_value());
    REQUIRE(*arg_as<int>(*item, 0) == 1);
}

TEST_CASE("StreamingWaiter: cancel drains before reporting Cancelled", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});
    waiter.process("on_msg", make_args(1));
    waiter.cancel();

    REQUIRE(waiter.take_next(std::nullopt).is_ok());
    auto after = waiter.take_next(std::nullopt);
    REQUIRE(after.is_err());
    REQUIRE(after.error().is_wait(hark_core::WaitError::Kind::Cancelled));
}

TEST_CASE("StreamingWaiter: cancel after close still reports Cancelled", "[event][streaming]") {
    StreamingWaiter waiter("on_msg", {});
    waiter.process("on_msg", make_args(1));
    waiter.close();
    waiter.cancel();

    REQUIRE(waiter.take_next(std::nullopt).is_ok());
    auto after = waiter.take_next(std::nullopt);
    REQUIRE(after.is_err());
    REQUIRE(after.error().is_wait(hark_core::WaitError::Kind::Cancelled));
}

TEST_CASE("Waiters: predicate runs without the waiter lock", "[event][streaming][oneshot]") {
    SECTION("streaming predicate may query its own waiter") {
        std::shared_ptr<StreamingWaiter> waiter;
        waiter = std::make_shared<StreamingWaiter>("on_msg", [&waiter](const Args&) {
            return waiter->pending() == 0;
        });

        REQUIRE(waiter->process("on_msg", make_args(1)));
        REQUIRE_FALSE(waiter->process("on_msg", make_args(2)));
        REQUIRE(waiter->pending() == 1);
    }

    SECTION("one-shot predicate may query its own waiter") {
        std::shared_ptr<OneShotWaiter> waiter;
        waiter = std::make_shared<OneShotWaiter>("on_x", [&waiter](const Args&) {
            return !waiter->is_signaled();
        });

        REQUIRE(waiter->process("on_x", make_args(1)));
        REQUIRE_FALSE(waiter->process("on_x", make_args(2)));
        auto result = waiter->wait(Clock::now());
        REQUIRE(*arg_as<int>(*result, 0) == 1);
    }
}
