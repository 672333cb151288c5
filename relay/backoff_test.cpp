#include "relay/backoff.hpp"
#include "gtest/gtest.h"

namespace {

using std::chrono::milliseconds;

// NOLINTNEXTLINE
TEST(Backoff, DoublesUpToMax) {
  relay::BackoffOptions options;
  options.initial = milliseconds(100);
  options.max = milliseconds(1000);
  relay::Backoff backoff(options);
  EXPECT_EQ(backoff.Next(), milliseconds(100));
  EXPECT_EQ(backoff.Next(), milliseconds(200));
  EXPECT_EQ(backoff.Next(), milliseconds(400));
  EXPECT_EQ(backoff.Next(), milliseconds(800));
  EXPECT_EQ(backoff.Next(), milliseconds(1000));
  EXPECT_EQ(backoff.Next(), milliseconds(1000));
  EXPECT_EQ(backoff.Attempts(), 6);
}

// NOLINTNEXTLINE
TEST(Backoff, NeverZero) {
  relay::BackoffOptions options;
  options.initial = milliseconds(0);
  relay::Backoff backoff(options);
  EXPECT_EQ(backoff.Next(), milliseconds(1));
}

}  // namespace
