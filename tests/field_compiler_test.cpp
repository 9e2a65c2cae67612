#include "cronkit/cron/field_compiler.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace cronkit;

class FieldCompilerTest : public ::testing::Test {
protected:
  // Builds a single-field token the way the tokenizer would.
  auto compile(FieldKind kind, std::string_view text)
      -> ParseResult<FieldConstraint> {
    storage_ = std::string(text);
    FieldToken token;
    token.kind = kind;
    token.text = storage_;
    std::size_t start = 0;
    while (true) {
      auto end = storage_.find(',', start);
      if (end == std::string::npos)
        end = storage_.size();
      token.terms.push_back(
          Term{std::string_view(storage_).substr(start, end - start), start});
      if (end == storage_.size())
        break;
      start = end + 1;
    }
    return compile_field(token);
  }

  auto values(FieldKind kind, std::string_view text) -> std::vector<int> {
    auto c = compile(kind, text);
    EXPECT_TRUE(c.has_value()) << text;
    if (!c || !std::holds_alternative<ValueSet>(*c))
      return {};
    return std::get<ValueSet>(*c).values();
  }

  std::string storage_;
};

TEST_F(FieldCompilerTest, StarIsFullSet) {
  auto c = compile(FieldKind::Minute, "*");
  ASSERT_TRUE(c.has_value());
  ASSERT_TRUE(std::holds_alternative<ValueSet>(*c));
  EXPECT_TRUE(std::get<ValueSet>(*c).is_full());
  EXPECT_FALSE(is_restricted(*c));
}

TEST_F(FieldCompilerTest, SingleValue) {
  EXPECT_EQ(values(FieldKind::Hour, "10"), (std::vector<int>{10}));
}

TEST_F(FieldCompilerTest, InclusiveRange) {
  EXPECT_EQ(values(FieldKind::Hour, "9-12"), (std::vector<int>{9, 10, 11, 12}));
}

TEST_F(FieldCompilerTest, StepFromStar) {
  EXPECT_EQ(values(FieldKind::Minute, "*/15"),
            (std::vector<int>{0, 15, 30, 45}));
}

TEST_F(FieldCompilerTest, StepFromValueRunsToFieldMax) {
  EXPECT_EQ(values(FieldKind::Second, "50/3"),
            (std::vector<int>{50, 53, 56, 59}));
}

TEST_F(FieldCompilerTest, StepWithinRange) {
  EXPECT_EQ(values(FieldKind::Minute, "10-30/10"),
            (std::vector<int>{10, 20, 30}));
}

TEST_F(FieldCompilerTest, ListIsUnion) {
  EXPECT_EQ(values(FieldKind::Hour, "1,3-4,3,20/2"),
            (std::vector<int>{1, 3, 4, 20, 22}));
}

TEST_F(FieldCompilerTest, MonthNamesCaseInsensitive) {
  EXPECT_EQ(values(FieldKind::Month, "jan,Mar-MAY"),
            (std::vector<int>{1, 3, 4, 5}));
}

TEST_F(FieldCompilerTest, WeekdayNamesAreOneBasedFromSunday) {
  EXPECT_EQ(values(FieldKind::DayOfWeek, "MON-FRI"),
            (std::vector<int>{2, 3, 4, 5, 6}));
  EXPECT_EQ(values(FieldKind::DayOfWeek, "SUN,SAT"), (std::vector<int>{1, 7}));
}

TEST_F(FieldCompilerTest, YearRange) {
  EXPECT_EQ(values(FieldKind::Year, "2030-2032"),
            (std::vector<int>{2030, 2031, 2032}));
}

TEST_F(FieldCompilerTest, QuestionMarkIsNoSpecificValue) {
  auto dom = compile(FieldKind::DayOfMonth, "?");
  ASSERT_TRUE(dom.has_value());
  EXPECT_TRUE(std::holds_alternative<NoSpecificValue>(*dom));
  EXPECT_FALSE(is_restricted(*dom));

  auto dow = compile(FieldKind::DayOfWeek, "?");
  ASSERT_TRUE(dow.has_value());
  EXPECT_TRUE(std::holds_alternative<NoSpecificValue>(*dow));
}

TEST_F(FieldCompilerTest, QuestionMarkRejectedOutsideDayFields) {
  auto c = compile(FieldKind::Hour, "?");
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(*c.error().field, FieldKind::Hour);
  EXPECT_EQ(c.error().offset, 0);
}

TEST_F(FieldCompilerTest, LastDayOfMonth) {
  auto c = compile(FieldKind::DayOfMonth, "L");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<LastDayOfMonth>(*c), LastDayOfMonth{0});
}

TEST_F(FieldCompilerTest, LastDayOfMonthWithOffset) {
  auto c = compile(FieldKind::DayOfMonth, "L-3");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<LastDayOfMonth>(*c), LastDayOfMonth{3});
}

TEST_F(FieldCompilerTest, LastDayOffsetTooLarge) {
  EXPECT_FALSE(compile(FieldKind::DayOfMonth, "L-31").has_value());
}

TEST_F(FieldCompilerTest, LastWeekdayOfMonth) {
  auto c = compile(FieldKind::DayOfMonth, "lw");
  ASSERT_TRUE(c.has_value());
  EXPECT_TRUE(std::holds_alternative<LastWeekdayOfMonth>(*c));
}

TEST_F(FieldCompilerTest, NearestWeekday) {
  auto c = compile(FieldKind::DayOfMonth, "15W");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<NearestWeekday>(*c), NearestWeekday{15});
}

TEST_F(FieldCompilerTest, NearestWeekdayOutOfRange) {
  auto c = compile(FieldKind::DayOfMonth, "32W");
  ASSERT_FALSE(c.has_value());
  EXPECT_NE(c.error().detail.find("out of range"), std::string::npos);
}

TEST_F(FieldCompilerTest, WeekdayMarkerRejectedInDayOfWeek) {
  EXPECT_FALSE(compile(FieldKind::DayOfWeek, "2W").has_value());
}

TEST_F(FieldCompilerTest, NthDayOfWeek) {
  auto c = compile(FieldKind::DayOfWeek, "6#3");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<NthDayOfWeek>(*c), (NthDayOfWeek{6, 3}));
}

TEST_F(FieldCompilerTest, NthDayOfWeekByName) {
  auto c = compile(FieldKind::DayOfWeek, "MON#1");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<NthDayOfWeek>(*c), (NthDayOfWeek{2, 1}));
}

TEST_F(FieldCompilerTest, NthOccurrenceOutOfRange) {
  auto c = compile(FieldKind::DayOfWeek, "6#6");
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error().offset, 2);
  EXPECT_FALSE(compile(FieldKind::DayOfWeek, "6#0").has_value());
}

TEST_F(FieldCompilerTest, LastDayOfWeek) {
  auto c = compile(FieldKind::DayOfWeek, "6L");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(std::get<LastDayOfWeek>(*c), LastDayOfWeek{6});
}

TEST_F(FieldCompilerTest, BareLInDayOfWeekIsSaturday) {
  EXPECT_EQ(values(FieldKind::DayOfWeek, "L"), (std::vector<int>{kSaturday}));
}

TEST_F(FieldCompilerTest, MarkersMustStandAlone) {
  EXPECT_FALSE(compile(FieldKind::DayOfMonth, "L,15").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfMonth, "1,15W").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfWeek, "2#1,3").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfMonth, "?,1").has_value());
}

TEST_F(FieldCompilerTest, LetterLRejectedOutsideDayFields) {
  auto c = compile(FieldKind::Hour, "L");
  ASSERT_FALSE(c.has_value());
  EXPECT_NE(c.error().detail.find("not allowed"), std::string::npos);
}

TEST_F(FieldCompilerTest, OutOfRangeValues) {
  EXPECT_FALSE(compile(FieldKind::Second, "60").has_value());
  EXPECT_FALSE(compile(FieldKind::Hour, "24").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfMonth, "0").has_value());
  EXPECT_FALSE(compile(FieldKind::Month, "13").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfWeek, "0").has_value());
  EXPECT_FALSE(compile(FieldKind::DayOfWeek, "8").has_value());
  EXPECT_FALSE(compile(FieldKind::Year, "1969").has_value());
  EXPECT_FALSE(compile(FieldKind::Year, "2100").has_value());
}

TEST_F(FieldCompilerTest, OutOfRangeReportsTermOffset) {
  auto c = compile(FieldKind::Minute, "5,61");
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error().offset, 2);
  EXPECT_EQ(c.error().detail, "value 61 out of range (0-59)");
}

TEST_F(FieldCompilerTest, UnknownName) {
  auto c = compile(FieldKind::Month, "JANUARY");
  ASSERT_FALSE(c.has_value());
  EXPECT_NE(c.error().detail.find("unknown name"), std::string::npos);
}

TEST_F(FieldCompilerTest, NamesRejectedInNumericFields) {
  EXPECT_FALSE(compile(FieldKind::Hour, "MON").has_value());
}

TEST_F(FieldCompilerTest, ReversedRangeRejected) {
  auto c = compile(FieldKind::Hour, "20-4");
  ASSERT_FALSE(c.has_value());
  EXPECT_NE(c.error().detail.find("greater than"), std::string::npos);
}

TEST_F(FieldCompilerTest, StepMustBePositiveAndWithinSpan) {
  EXPECT_FALSE(compile(FieldKind::Minute, "*/0").has_value());
  EXPECT_FALSE(compile(FieldKind::Minute, "*/61").has_value());
  EXPECT_FALSE(compile(FieldKind::Minute, "*/").has_value());
  EXPECT_TRUE(compile(FieldKind::Minute, "*/60").has_value());
}

TEST_F(FieldCompilerTest, MalformedNumbers) {
  EXPECT_FALSE(compile(FieldKind::Minute, "1-").has_value());
  EXPECT_FALSE(compile(FieldKind::Minute, "-5").has_value());
  EXPECT_FALSE(compile(FieldKind::Minute, "5x").has_value());
}

TEST_F(FieldCompilerTest, FullRangeIsUnrestricted) {
  auto c = compile(FieldKind::DayOfWeek, "1-7");
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(is_restricted(*c));
}
