#include <gtest/gtest.h>

#include "advisories.hpp"

TEST(AdvisoriesTest, IsoDateShape) {
  EXPECT_TRUE(looks_like_iso_date("2024-01-15"));
  // shape only, no calendar check
  EXPECT_TRUE(looks_like_iso_date("2024-02-31"));
  EXPECT_FALSE(looks_like_iso_date("2024-1-15"));
  EXPECT_FALSE(looks_like_iso_date("15/01/2024"));
  EXPECT_FALSE(looks_like_iso_date("2024-01-15T10:00"));
  EXPECT_FALSE(looks_like_iso_date(""));
}

TEST(AdvisoriesTest, CleanExpenseHasNoWarnings) {
  EXPECT_TRUE(advise({"2024-01-15", 4.0, "food", std::nullopt, std::nullopt}).empty());
}

TEST(AdvisoriesTest, WarnsOnBadDateAndBlankCategory) {
  auto w = advise({"Jan 15", 4.0, "  ", std::nullopt, std::nullopt});
  EXPECT_EQ(w.size(), 2u);
}

TEST(AdvisoriesTest, WarnsOnReversedRange) {
  EXPECT_TRUE(advise_range("2024-01-01", "2024-01-31").empty());
  EXPECT_TRUE(advise_range("2024-01-01", "2024-01-01").empty());
  auto w = advise_range("2024-03-01", "2024-01-01");
  ASSERT_EQ(w.size(), 1u);
  EXPECT_NE(w[0].find("after"), std::string::npos);
}
