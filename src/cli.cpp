#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"expense_tracker init [--db path]\n"
"expense_tracker add DATE AMOUNT CATEGORY [--subcategory S] [--note N] [--db path]\n"
"expense_tracker list START END [--db path]\n"
"expense_tracker summarize START END [--category C] [--db path]\n"
"expense_tracker categories [--categories path]\n";

static double parse_amount(const std::string& s) {
  size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &used);
  } catch (const std::exception&) {
    throw UsageError("amount is not a number: " + s);
  }
  if (used != s.size()) throw UsageError("amount is not a number: " + s);
  return v;
}

Args parse_args(const std::vector<std::string>& argv) {
  Args a;
  if (argv.size() < 2) throw UsageError("missing command");
  a.mode = argv[1];
  size_t i = 2;

  auto positional = [&](std::string& dst, const char* name) {
    if (i >= argv.size() || argv[i].rfind("--", 0) == 0)
      throw UsageError(std::string("missing ") + name);
    dst = argv[i++];
  };

  if (a.mode == "add") {
    std::string amount;
    positional(a.date, "DATE");
    positional(amount, "AMOUNT");
    positional(a.category, "CATEGORY");
    a.amount = parse_amount(amount);
  } else if (a.mode == "list" || a.mode == "summarize") {
    positional(a.start_date, "START");
    positional(a.end_date, "END");
  } else if (a.mode != "init" && a.mode != "categories") {
    throw UsageError("unknown command: " + a.mode);
  }

  while (i < argv.size()) {
    std::string f = argv[i++];
    auto next = [&]() -> std::string {
      if (i >= argv.size()) throw UsageError("missing value after " + f);
      return argv[i++];
    };
    if (f == "--db") a.sqlite_path = next();
    else if (f == "--categories" && a.mode == "categories") a.categories_path = next();
    else if (f == "--subcategory" && a.mode == "add") a.subcategory = next();
    else if (f == "--note" && a.mode == "add") a.note = next();
    else if (f == "--category" && a.mode == "summarize") a.filter_category = next();
    else throw UsageError("unknown flag: " + f);
  }
  return a;
}

Args parse_cli(int argc, char** argv) {
  try {
    return parse_args(std::vector<std::string>(argv, argv + argc));
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n" << USAGE;
    std::exit(1);
  }
}
