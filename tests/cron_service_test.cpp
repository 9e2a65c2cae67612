#include "cronkit/service/cron_service.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <format>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace cronkit;
using namespace cronkit::test;

class CronServiceTest : public ::testing::Test {
protected:
  CronService service_{ServiceConfig{TimeZone::Utc, 8}};
};

TEST_F(CronServiceTest, IsValidExpression) {
  EXPECT_TRUE(service_.is_valid_expression("0 0 12 * * ?"));
  EXPECT_FALSE(service_.is_valid_expression("* * * * *"));
  EXPECT_FALSE(service_.is_valid_expression("0 0 25 * * ?"));
}

TEST_F(CronServiceTest, FormatExpression) {
  auto canonical = service_.format_expression("0 15 10 ? * MON-FRI");
  ASSERT_TRUE(canonical.has_value());
  EXPECT_EQ(*canonical, "0 15 10 ? * 2-6 *");
}

TEST_F(CronServiceTest, FormatExpressionRejectsMalformed) {
  auto canonical = service_.format_expression("0 0 0 1 FOO ?");
  ASSERT_FALSE(canonical.has_value());
  EXPECT_EQ(canonical.error(), Error::MalformedExpression);
}

TEST_F(CronServiceTest, NextTime) {
  auto next = service_.next_time("0 0 2 1 * ? *", utc(2020, 4, 16));
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, utc(2020, 5, 1, 2, 0, 0));
}

TEST_F(CronServiceTest, NextTimeDefaultsToNow) {
  auto before = Clock::now();
  auto next = service_.next_time("* * * * * ?");
  ASSERT_TRUE(next.has_value());
  EXPECT_GT(*next, before);
  EXPECT_LE(*next - before, std::chrono::seconds(2));
}

TEST_F(CronServiceTest, NextTimeExhausted) {
  auto next = service_.next_time("0 0 0 1 1 ? 2020", utc(2021, 1, 1));
  ASSERT_FALSE(next.has_value());
  EXPECT_EQ(next.error(), Error::Exhausted);
}

TEST_F(CronServiceTest, NextTimesChainsResults) {
  auto times = service_.next_times("0 15 10 ? * 6#3", utc(2020, 4, 1), 3);
  ASSERT_TRUE(times.has_value());
  ASSERT_EQ(times->size(), 3);
  EXPECT_EQ((*times)[0], utc(2020, 4, 17, 10, 15, 0));
  EXPECT_EQ((*times)[1], utc(2020, 5, 15, 10, 15, 0));
  EXPECT_EQ((*times)[2], utc(2020, 6, 19, 10, 15, 0));
}

TEST_F(CronServiceTest, NextTimesStopsAtYearBound) {
  auto times = service_.next_times("0 0 0 1 1 ? 2098-2099", utc(2097, 6, 1), 5);
  ASSERT_TRUE(times.has_value());
  EXPECT_EQ(times->size(), 2);
}

TEST_F(CronServiceTest, NextTimesRejectsNonPositiveCount) {
  auto times = service_.next_times("0 0 12 * * ?", utc(2020, 1, 1), 0);
  ASSERT_FALSE(times.has_value());
  EXPECT_EQ(times.error(), Error::InvalidArgument);
}

TEST_F(CronServiceTest, PreviousTime) {
  auto prev = service_.previous_time("0 15 10 ? * 6L", utc(2020, 8, 1));
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(*prev, utc(2020, 7, 31, 10, 15, 0));
}

TEST_F(CronServiceTest, IsSatisfiedBy) {
  auto yes = service_.is_satisfied_by("0 15 10 ? * MON-FRI",
                                      utc(2020, 4, 20, 10, 15, 0));
  ASSERT_TRUE(yes.has_value());
  EXPECT_TRUE(*yes);

  auto bad = service_.is_satisfied_by("bogus", utc(2020, 4, 20));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::MalformedExpression);
}

TEST_F(CronServiceTest, StringVariants) {
  auto next = service_.next_time_str("0 0 2 1 * ? *", utc(2020, 4, 16));
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, "2020-05-01 02:00:00");

  auto many = service_.next_time_strs("0 0 12 * * ?", utc(2020, 1, 1), 2,
                                      "%m/%d");
  ASSERT_TRUE(many.has_value());
  EXPECT_EQ(*many, (std::vector<std::string>{"01/01", "01/02"}));

  auto prev = service_.previous_time_str("0 0 12 * * ?", utc(2020, 1, 1));
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(*prev, "2019-12-31 12:00:00");
}

TEST_F(CronServiceTest, CompileCachesByText) {
  auto a = service_.compile("0 0 12 * * ?");
  auto b = service_.compile("0 0 12 * * ?");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->get(), b->get());
  EXPECT_EQ(service_.cache_size(), 1);

  service_.clear_cache();
  EXPECT_EQ(service_.cache_size(), 0);
}

TEST_F(CronServiceTest, RejectedExpressionsAreNotCached) {
  EXPECT_FALSE(service_.compile("0 0 12 * *").has_value());
  EXPECT_EQ(service_.cache_size(), 0);
}

TEST_F(CronServiceTest, CacheStaysWithinCapacity) {
  for (int minute = 0; minute < 20; ++minute) {
    auto expr = std::format("0 {} * * * ?", minute);
    ASSERT_TRUE(service_.compile(expr).has_value());
    EXPECT_LE(service_.cache_size(), 8);
  }
}

TEST_F(CronServiceTest, ConcurrentCallers) {
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t, &failures] {
      for (int i = 0; i < 200; ++i) {
        auto expr = std::format("0 {} * * * ?", (t * 7 + i) % 60);
        auto next = service_.next_time(expr, utc(2024, 1, 1));
        if (!next)
          failures++;
      }
    });
  }
  for (auto& th : threads)
    th.join();
  EXPECT_EQ(failures.load(), 0);
}
