#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

#include "core/cancellation.hpp"
#include "core/errors.hpp"

using namespace resumedl;

TEST_CASE("cancelling a parent cancels its children with the same cause", "[cancellation]") {
    context_ptr parent = cancellation_context::create();
    context_ptr child = cancellation_context::with_parent(parent);
    context_ptr grandchild = cancellation_context::with_parent(child);

    REQUIRE_FALSE(child->is_cancelled());
    parent->cancel(cancel_cause::deadline_exceeded);

    REQUIRE(child->is_cancelled());
    REQUIRE(grandchild->is_cancelled());
    REQUIRE(grandchild->cause() == cancel_cause::deadline_exceeded);
}

TEST_CASE("cancelling a child leaves the parent alone", "[cancellation]") {
    context_ptr parent = cancellation_context::create();
    context_ptr child = cancellation_context::with_parent(parent);

    child->cancel();
    REQUIRE(child->is_cancelled());
    REQUIRE_FALSE(parent->is_cancelled());
}

TEST_CASE("the first cancellation decides the cause", "[cancellation]") {
    context_ptr ctx = cancellation_context::create();
    ctx->cancel(cancel_cause::deadline_exceeded);
    ctx->cancel(cancel_cause::none);
    REQUIRE(ctx->cause() == cancel_cause::deadline_exceeded);

    context_ptr other = cancellation_context::create();
    other->cancel(cancel_cause::none);
    other->cancel(cancel_cause::deadline_exceeded);
    REQUIRE(other->cause() == cancel_cause::none);
}

TEST_CASE("child of an already cancelled parent starts cancelled", "[cancellation]") {
    context_ptr parent = cancellation_context::create();
    parent->cancel();
    REQUIRE(cancellation_context::with_parent(parent)->is_cancelled());
}

TEST_CASE("on_cancel callbacks run once", "[cancellation]") {
    context_ptr ctx = cancellation_context::create();
    int calls = 0;
    int removed_calls = 0;
    ctx->on_cancel([&] { ++calls; });
    auto id = ctx->on_cancel([&] { ++removed_calls; });
    ctx->remove_on_cancel(id);

    std::thread canceller([&] { ctx->cancel(); });
    canceller.join();
    ctx->cancel();

    REQUIRE(calls == 1);
    REQUIRE(removed_calls == 0);

    // Registered after the fact: runs immediately.
    ctx->on_cancel([&] { ++calls; });
    REQUIRE(calls == 2);
}

TEST_CASE("cancellation maps to timeout or cancelled errors", "[cancellation]") {
    context_ptr timed_out = cancellation_context::create();
    timed_out->cancel(cancel_cause::deadline_exceeded);
    REQUIRE_THROWS_AS(timed_out->throw_cancelled(), timeout_error);

    context_ptr cancelled = cancellation_context::create();
    cancelled->cancel();
    REQUIRE_THROWS_AS(cancelled->throw_cancelled(), cancelled_error);
}

TEST_CASE("a destroyed child is no longer notified", "[cancellation]") {
    context_ptr parent = cancellation_context::create();
    {
        context_ptr child = cancellation_context::with_parent(parent);
    }
    REQUIRE_NOTHROW(parent->cancel());
}
