#include "advisories.hpp"
#include <re2/re2.h>

bool looks_like_iso_date(const std::string& s) {
  static const RE2 iso(R"(\d{4}-\d{2}-\d{2})");
  return RE2::FullMatch(s, iso);
}

static bool blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::vector<std::string> advise(const NewExpense& e) {
  std::vector<std::string> out;
  if (!looks_like_iso_date(e.date))
    out.push_back("date '" + e.date + "' is not YYYY-MM-DD; range queries compare dates as strings");
  if (blank(e.category))
    out.push_back("category is blank; it will be stored and grouped as-is");
  return out;
}

std::vector<std::string> advise_range(const std::string& start_date, const std::string& end_date) {
  std::vector<std::string> out;
  if (!looks_like_iso_date(start_date))
    out.push_back("start date '" + start_date + "' is not YYYY-MM-DD");
  if (!looks_like_iso_date(end_date))
    out.push_back("end date '" + end_date + "' is not YYYY-MM-DD");
  if (start_date > end_date)
    out.push_back("start date is after end date; nothing can match");
  return out;
}
