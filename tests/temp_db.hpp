#pragma once
#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <unistd.h>

// Fresh database file per test, removed afterwards.
class TempDbTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = std::filesystem::temp_directory_path() /
            (std::string("expense_") + info->test_suite_name() + "_" + info->name() +
             "_" + std::to_string(::getpid()) + ".db");
    Cleanup();
    cfg_.sqlite_path = path_.string();
  }

  void TearDown() override { Cleanup(); }

  void Cleanup() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_.string() + "-journal", ec);
  }

  std::filesystem::path path_;
  StoreConfig cfg_;
};
