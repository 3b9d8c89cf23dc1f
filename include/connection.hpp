#pragma once
#include "config.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Raised for every failure of the backing database: open, prepare, bind, step.
class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Statement {
public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind_text(int idx, const std::string& v);
  void bind_double(int idx, double v);

  // true while a row is available, false once done
  bool step();

  int64_t column_int64(int col) const;
  double column_double(int col) const;
  std::string column_text(int col) const;   // NULL reads as ""

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

// One connection, scoped to a single store operation.
class Connection {
public:
  explicit Connection(const StoreConfig& cfg);
  ~Connection();
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void exec(const std::string& sql);
  Statement prepare(const std::string& sql) { return Statement(db_, sql); }
  int64_t last_insert_id() const;

private:
  sqlite3* db_ = nullptr;
};
