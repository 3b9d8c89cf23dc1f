#include <gtest/gtest.h>

#include "categories.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

TEST(CategoriesTest, NamesFromObjectKeys) {
  auto names = category_names(R"({"food": ["groceries"], "transport": [], "bills": ["power"]})");
  EXPECT_EQ(names, (std::vector<std::string>{"bills", "food", "transport"}));
}

TEST(CategoriesTest, NamesFromArray) {
  auto names = category_names(R"(["food", "transport"])");
  EXPECT_EQ(names, (std::vector<std::string>{"food", "transport"}));
}

TEST(CategoriesTest, RejectsMalformedDocuments) {
  EXPECT_THROW(category_names("{not json"), std::runtime_error);
  EXPECT_THROW(category_names("42"), std::runtime_error);
  EXPECT_THROW(category_names(R"(["food", 3])"), std::runtime_error);
}

TEST(CategoriesTest, ReadReturnsFileVerbatim) {
  auto path = std::filesystem::temp_directory_path() /
              ("expense_categories_" + std::to_string(::getpid()) + ".json");
  const std::string doc = "[\"food\",  \"travel\"]\n";
  {
    std::ofstream out(path, std::ios::binary);
    out << doc;
  }
  EXPECT_EQ(read_categories(path.string()), doc);
  std::filesystem::remove(path);
}

TEST(CategoriesTest, ReadMissingFileThrows) {
  EXPECT_THROW(read_categories("/nonexistent/categories.json"), std::runtime_error);
}
