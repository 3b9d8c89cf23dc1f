#pragma once
#include <string>

struct StoreConfig {
  std::string sqlite_path = "./expenses.db";
  int busy_timeout_ms = 5000;   // wait on the write lock before failing
};
