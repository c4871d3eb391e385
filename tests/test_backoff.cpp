#include <gtest/gtest.h>

#include "domain/BackoffSchedule.hpp"
#include "domain/Errors.hpp"

using tether::initiator::domain::BackoffSchedule;
using tether::initiator::domain::ConfigError;
using namespace std::chrono_literals;

TEST(BackoffSchedule, FirstFailureUsesFirstEntry) {
  auto b = BackoffSchedule::from_seconds({1, 5, 30});
  EXPECT_EQ(b.delay_for(0), 1000ms);
  EXPECT_EQ(b.delay_for(-3), 1000ms);
  EXPECT_EQ(b.delay_for(1), 1000ms);
  EXPECT_EQ(b.delay_for(2), 5000ms);
  EXPECT_EQ(b.delay_for(3), 30000ms);
}

TEST(BackoffSchedule, ClampsToLastEntry) {
  auto b = BackoffSchedule::from_seconds({1, 5, 30});
  for (int f = 3; f < 50; ++f) EXPECT_EQ(b.delay_for(f), 30000ms) << "failures=" << f;
}

TEST(BackoffSchedule, NonDecreasingForOrderedSchedule) {
  BackoffSchedule b({100ms, 200ms, 200ms, 800ms});
  auto prev = b.delay_for(0);
  for (int f = 1; f < 10; ++f) {
    EXPECT_GE(b.delay_for(f), prev);
    prev = b.delay_for(f);
  }
}

TEST(BackoffSchedule, SingleEntryIsConstant) {
  BackoffSchedule b({250ms});
  EXPECT_EQ(b.delay_for(0), 250ms);
  EXPECT_EQ(b.delay_for(7), 250ms);
}

TEST(BackoffSchedule, RejectsEmptyOrNonPositive) {
  EXPECT_THROW(BackoffSchedule(std::vector<std::chrono::milliseconds>{}), ConfigError);
  EXPECT_THROW(BackoffSchedule::from_seconds({1, 0, 3}), ConfigError);
  EXPECT_THROW(BackoffSchedule::from_seconds({-1}), ConfigError);
}
