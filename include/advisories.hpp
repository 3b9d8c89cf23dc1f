#pragma once
#include "store.hpp"
#include <string>
#include <vector>

// Shape check only (YYYY-MM-DD); no calendar validation.
bool looks_like_iso_date(const std::string& s);

// Warnings for input the store will accept but that is probably a mistake.
// The store itself never rejects these.
std::vector<std::string> advise(const NewExpense& e);
std::vector<std::string> advise_range(const std::string& start_date, const std::string& end_date);
