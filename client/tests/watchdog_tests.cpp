#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

#include "core/watchdog.hpp"

using namespace resumedl;
using namespace std::chrono_literals;

TEST_CASE("zero timeout disables the watchdog", "[watchdog]") {
    watchdog dog(cancellation_context::create(), 0ms);
    REQUIRE(dog.current_state() == watchdog::state::disabled);

    dog.kick();
    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(dog.context()->is_cancelled());

    dog.cancel();
    REQUIRE(dog.context()->is_cancelled());
    REQUIRE(dog.context()->cause() == cancel_cause::none);
}

TEST_CASE("watchdog fires after the inactivity timeout", "[watchdog]") {
    auto start = std::chrono::steady_clock::now();
    watchdog dog(cancellation_context::create(), 100ms);
    REQUIRE(dog.current_state() == watchdog::state::armed);

    while (!dog.context()->is_cancelled() && std::chrono::steady_clock::now() - start < 5s) {
        std::this_thread::sleep_for(5ms);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(dog.current_state() == watchdog::state::fired);
    REQUIRE(dog.context()->cause() == cancel_cause::deadline_exceeded);
    REQUIRE(elapsed >= 100ms);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("kicks keep the watchdog from firing", "[watchdog]") {
    watchdog dog(cancellation_context::create(), 150ms);
    for (int i = 0; i < 10; ++i) {
        std::this_thread::sleep_for(40ms);
        dog.kick();
    }
    REQUIRE_FALSE(dog.context()->is_cancelled());
    REQUIRE(dog.current_state() == watchdog::state::armed);
}

TEST_CASE("clean cancel stops the timer without a cause", "[watchdog]") {
    watchdog dog(cancellation_context::create(), 100ms);
    dog.cancel();
    REQUIRE(dog.current_state() == watchdog::state::cancelled_clean);
    REQUIRE(dog.context()->cause() == cancel_cause::none);

    std::this_thread::sleep_for(200ms);
    REQUIRE(dog.current_state() == watchdog::state::cancelled_clean);
    REQUIRE(dog.context()->cause() == cancel_cause::none);

    dog.cancel();
    dog.kick();
    REQUIRE(dog.current_state() == watchdog::state::cancelled_clean);
}

TEST_CASE("cancel after firing keeps the deadline cause", "[watchdog]") {
    watchdog dog(cancellation_context::create(), 20ms);
    std::this_thread::sleep_for(200ms);
    REQUIRE(dog.current_state() == watchdog::state::fired);

    dog.cancel();
    REQUIRE(dog.current_state() == watchdog::state::fired);
    REQUIRE(dog.context()->cause() == cancel_cause::deadline_exceeded);
}

TEST_CASE("parent cancellation reaches the watchdog context", "[watchdog]") {
    context_ptr parent = cancellation_context::create();
    watchdog dog(parent, 10s);
    parent->cancel();
    REQUIRE(dog.context()->is_cancelled());
    REQUIRE(dog.context()->cause() == cancel_cause::none);
}
