// =============================================================================
// call_context_test.cpp
// =============================================================================
// Unit tests for orex::CallContext and orex::CancellationToken.
//
// Validates:
//   - A default context never expires
//   - withTimeout() sets a deadline and remaining() counts down to zero
//   - throwIfDone() maps cancellation to Execution/ERR_CANCELLED and an
//     elapsed deadline to Network/ERR_TIMEOUT
//   - A shared token cancels every context built on it
// =============================================================================

#include "orex/resilience/call_context.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using orex::CallContext;
using orex::ErrorCode;
using orex::ErrorType;
using orex::ExecutionError;

TEST(CallContextTest, DefaultContextHasNoDeadline) {
  CallContext ctx;
  EXPECT_FALSE(ctx.hasDeadline());
  EXPECT_FALSE(ctx.expired());
  EXPECT_FALSE(ctx.cancelled());
  EXPECT_GT(ctx.remaining(), std::chrono::milliseconds(24 * 3'600'000));
  EXPECT_NO_THROW(ctx.throwIfDone("test", "placeOrder"));
}

TEST(CallContextTest, TimeoutCountsDown) {
  auto ctx = CallContext::withTimeout(10s);
  EXPECT_TRUE(ctx.hasDeadline());
  EXPECT_LE(ctx.remaining(), 10'000ms);
  EXPECT_GT(ctx.remaining(), 9'000ms);
}

TEST(CallContextTest, ElapsedDeadlineIsATimeout) {
  auto ctx = CallContext::withTimeout(5ms);
  std::this_thread::sleep_for(20ms);

  EXPECT_TRUE(ctx.expired());
  EXPECT_EQ(ctx.remaining().count(), 0);
  try {
    ctx.throwIfDone("ZmqBridge", "getQuote");
    FAIL() << "expired context did not throw";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.type(), ErrorType::Network);
    EXPECT_EQ(e.code(), ErrorCode::Timeout);
    EXPECT_EQ(e.message(), "getQuote deadline exceeded");
    EXPECT_EQ(e.source(), "ZmqBridge");
  }
}

TEST(CallContextTest, CancellationWinsOverDeadline) {
  auto token = std::make_shared<orex::CancellationToken>();
  auto ctx = CallContext::withTimeout(1ms, token);
  std::this_thread::sleep_for(5ms);
  token->cancel();

  try {
    ctx.throwIfDone("router", "placeOrder");
    FAIL() << "cancelled context did not throw";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.type(), ErrorType::Execution);
    EXPECT_EQ(e.code(), ErrorCode::Cancelled);
    EXPECT_EQ(e.message(), "placeOrder cancelled");
  }
}

TEST(CallContextTest, SharedTokenCancelsEveryContext) {
  auto token = std::make_shared<orex::CancellationToken>();
  auto first = CallContext::withTimeout(10s, token);
  auto second = CallContext::withTimeout(10s, token);

  token->cancel();
  EXPECT_TRUE(first.cancelled());
  EXPECT_TRUE(second.cancelled());
  EXPECT_EQ(first.token(), second.token());
}

TEST(CallContextTest, NullTokenIsReplaced) {
  CallContext ctx(CallContext::Clock::now() + 1s, nullptr);
  ASSERT_NE(ctx.token(), nullptr);
  EXPECT_FALSE(ctx.cancelled());
}
