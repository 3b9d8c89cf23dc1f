#include "output.hpp"

using json = nlohmann::json;

json created_json(int64_t id) {
  return json{{"status", "ok"}, {"id", id}};
}

json expense_json(const Expense& e) {
  return json{
    {"id", e.id},
    {"date", e.date},
    {"amount", e.amount},
    {"category", e.category},
    {"subcategory", e.subcategory},
    {"note", e.note},
  };
}

json expenses_json(const std::vector<Expense>& rows) {
  json out = json::array();
  for (auto& e : rows) out.push_back(expense_json(e));
  return out;
}

json totals_json(const std::vector<CategoryTotal>& totals) {
  json out = json::array();
  for (auto& t : totals)
    out.push_back(json{{"category", t.category}, {"total_amount", t.total_amount}});
  return out;
}

std::string render(const json& j, int indent) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}
