#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct Args {
  std::string mode;          // "init", "add", "list", "summarize" or "categories"
  std::string sqlite_path = "./expenses.db";
  std::string categories_path = "./categories.json";

  // add
  std::string date;
  double amount = 0.0;
  std::string category;
  std::optional<std::string> subcategory;
  std::optional<std::string> note;

  // list / summarize
  std::string start_date;
  std::string end_date;
  std::optional<std::string> filter_category;
};

struct UsageError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Throws UsageError on a bad command line.
Args parse_args(const std::vector<std::string>& argv);

// parse_args, printing usage and exiting with status 1 on error.
Args parse_cli(int argc, char** argv);
