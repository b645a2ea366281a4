#include "service-supervisor/BoundedRetry.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace svcsup;
using namespace std::chrono_literals;

TEST(BoundedRetryTest, SucceedsOnFirstAttemptWithoutWaiting) {
  int calls = 0;
  auto start = std::chrono::steady_clock::now();
  auto outcome = retry_bounded(RetryPolicy{5, 500ms}, [&](int) {
    ++calls;
    return true;
  });
  EXPECT_EQ(outcome, RetryOutcome::Succeeded);
  EXPECT_EQ(calls, 1);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
}

TEST(BoundedRetryTest, PassesOneBasedAttemptNumbers) {
  std::vector<int> seen;
  auto outcome = retry_bounded(RetryPolicy{3, 0ms}, [&](int n) {
    seen.push_back(n);
    return n == 3;
  });
  EXPECT_EQ(outcome, RetryOutcome::Succeeded);
  EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
}

TEST(BoundedRetryTest, ExhaustsBudget) {
  int calls = 0;
  auto outcome = retry_bounded(RetryPolicy{4, 1ms}, [&](int) {
    ++calls;
    return false;
  });
  EXPECT_EQ(outcome, RetryOutcome::Exhausted);
  EXPECT_EQ(calls, 4);
}

TEST(BoundedRetryTest, WaitsOnlyBetweenAttempts) {
  auto start = std::chrono::steady_clock::now();
  retry_bounded(RetryPolicy{3, 100ms}, [](int) { return false; });
  auto elapsed = std::chrono::steady_clock::now() - start;
  // Two gaps, not three
  EXPECT_GE(elapsed, 190ms);
  EXPECT_LT(elapsed, 1s);
}

TEST(BoundedRetryTest, AlreadyCancelledTokenRunsNoAttempt) {
  CancellationToken token;
  token.cancel();
  int calls = 0;
  auto outcome = retry_bounded(
      RetryPolicy{3, 10ms},
      [&](int) {
        ++calls;
        return true;
      },
      &token);
  EXPECT_EQ(outcome, RetryOutcome::Cancelled);
  EXPECT_EQ(calls, 0);
}

TEST(BoundedRetryTest, CancelInterruptsWait) {
  CancellationToken token;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(100ms);
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  auto outcome =
      retry_bounded(RetryPolicy{10, 5s}, [](int) { return false; }, &token);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_EQ(outcome, RetryOutcome::Cancelled);
  EXPECT_LT(elapsed, 2s);
}

TEST(CancellationTokenTest, WaitReturnsFalseOnTimeout) {
  CancellationToken token;
  EXPECT_FALSE(token.wait_for(20ms));
  EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTokenTest, ResetClearsCancellation) {
  CancellationToken token;
  token.cancel();
  EXPECT_TRUE(token.wait_for(1s));
  token.reset();
  EXPECT_FALSE(token.is_cancelled());
}
