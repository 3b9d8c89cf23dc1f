#pragma once
#include "config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Expense {
  int64_t id = 0;
  std::string date;         // YYYY-MM-DD, compared as a string
  double amount = 0.0;
  std::string category;
  std::string subcategory;  // "" when not given
  std::string note;         // "" when not given
};

struct NewExpense {
  std::string date;
  double amount = 0.0;
  std::string category;
  std::optional<std::string> subcategory;
  std::optional<std::string> note;
};

struct CategoryTotal {
  std::string category;
  double total_amount = 0.0;
};

// Every operation opens its own connection and is all-or-nothing.
// ensure_schema() must have run against the same config first.
// Storage failures are thrown as StorageError.
class ExpenseStore {
public:
  explicit ExpenseStore(StoreConfig cfg);

  int64_t create(const NewExpense& e);

  // Inclusive on both bounds, ordered by id. start > end gives an empty result.
  std::vector<Expense> list_by_date_range(const std::string& start_date,
                                          const std::string& end_date) const;

  // Totals per category over the same inclusive range, ordered by category.
  // A given category restricts to exact (case-sensitive) matches.
  std::vector<CategoryTotal> summarize(const std::string& start_date,
                                       const std::string& end_date,
                                       const std::optional<std::string>& category = std::nullopt) const;

private:
  StoreConfig cfg_;
};
