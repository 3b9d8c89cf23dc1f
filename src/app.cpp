#include "app.hpp"
#include "config.hpp"
#include "schema.hpp"
#include "store.hpp"
#include "categories.hpp"
#include "advisories.hpp"
#include "output.hpp"

#include <stdexcept>

static void warn_all(std::ostream& err, const std::vector<std::string>& warnings) {
  for (auto& w : warnings) err << "warning: " << w << "\n";
}

static int dispatch(const Args& args, std::ostream& out, std::ostream& err) {
  if (args.mode == "categories") {
    std::string doc = read_categories(args.categories_path);
    auto names = category_names(doc);
    if (names.empty()) throw std::runtime_error("categories: document lists no categories");
    out << doc;
    if (doc.back() != '\n') out << "\n";
    return 0;
  }

  StoreConfig cfg;
  cfg.sqlite_path = args.sqlite_path;
  ensure_schema(cfg);
  ExpenseStore store(cfg);

  if (args.mode == "init") {
    err << "Schema ready in " << cfg.sqlite_path << "\n";
    return 0;
  }

  if (args.mode == "add") {
    NewExpense e{ args.date, args.amount, args.category, args.subcategory, args.note };
    warn_all(err, advise(e));
    out << render(created_json(store.create(e))) << "\n";
    return 0;
  }

  if (args.mode == "list") {
    warn_all(err, advise_range(args.start_date, args.end_date));
    out << render(expenses_json(store.list_by_date_range(args.start_date, args.end_date)), 2) << "\n";
    return 0;
  }

  if (args.mode == "summarize") {
    warn_all(err, advise_range(args.start_date, args.end_date));
    auto totals = store.summarize(args.start_date, args.end_date, args.filter_category);
    out << render(totals_json(totals), 2) << "\n";
    return 0;
  }

  err << "error: unknown command: " << args.mode << "\n";
  return 1;
}

int run_command(const Args& args, std::ostream& out, std::ostream& err) {
  try {
    return dispatch(args, out, err);
  } catch (const std::exception& e) {
    err << "error: " << e.what() << "\n";
    return 1;
  }
}
