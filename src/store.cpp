#include "store.hpp"
#include "connection.hpp"
#include <utility>

ExpenseStore::ExpenseStore(StoreConfig cfg) : cfg_(std::move(cfg)) {}

int64_t ExpenseStore::create(const NewExpense& e) {
  const char* sql =
    "INSERT INTO expenses (date, amount, category, subcategory, note) "
    "VALUES (?, ?, ?, ?, ?);";
  Connection conn(cfg_);
  auto st = conn.prepare(sql);
  st.bind_text(1, e.date);
  st.bind_double(2, e.amount);
  st.bind_text(3, e.category);
  st.bind_text(4, e.subcategory.value_or(""));
  st.bind_text(5, e.note.value_or(""));
  st.step();
  return conn.last_insert_id();
}

std::vector<Expense> ExpenseStore::list_by_date_range(const std::string& start_date,
                                                      const std::string& end_date) const {
  const char* sql =
    "SELECT id, date, amount, category, subcategory, note FROM expenses "
    "WHERE date BETWEEN ? AND ? "
    "ORDER BY id ASC;";
  Connection conn(cfg_);
  auto st = conn.prepare(sql);
  st.bind_text(1, start_date);
  st.bind_text(2, end_date);

  std::vector<Expense> out;
  while (st.step()) {
    Expense x;
    x.id          = st.column_int64(0);
    x.date        = st.column_text(1);
    x.amount      = st.column_double(2);
    x.category    = st.column_text(3);
    x.subcategory = st.column_text(4);
    x.note        = st.column_text(5);
    out.push_back(std::move(x));
  }
  return out;
}

std::vector<CategoryTotal> ExpenseStore::summarize(const std::string& start_date,
                                                   const std::string& end_date,
                                                   const std::optional<std::string>& category) const {
  std::string sql =
    "SELECT category, SUM(amount) AS total_amount FROM expenses "
    "WHERE date BETWEEN ? AND ?";
  if (category) sql += " AND category = ?";
  sql += " GROUP BY category ORDER BY category ASC;";

  Connection conn(cfg_);
  auto st = conn.prepare(sql);
  st.bind_text(1, start_date);
  st.bind_text(2, end_date);
  if (category) st.bind_text(3, *category);

  std::vector<CategoryTotal> out;
  while (st.step()) {
    out.push_back(CategoryTotal{ st.column_text(0), st.column_double(1) });
  }
  return out;
}
