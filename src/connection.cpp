#include "connection.hpp"
#include <sqlite3.h>

[[noreturn]] static void fail(sqlite3* db, const std::string& what) {
  std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
  throw StorageError("sqlite " + what + ": " + msg);
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK)
    fail(db_, "prepare");
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

void Statement::bind_text(int idx, const std::string& v) {
  if (sqlite3_bind_text(st_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT) != SQLITE_OK)
    fail(db_, "bind");
}

void Statement::bind_double(int idx, double v) {
  if (sqlite3_bind_double(st_, idx, v) != SQLITE_OK)
    fail(db_, "bind");
}

bool Statement::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  fail(db_, "step");
}

int64_t Statement::column_int64(int col) const {
  return (int64_t)sqlite3_column_int64(st_, col);
}

double Statement::column_double(int col) const {
  return sqlite3_column_double(st_, col);
}

std::string Statement::column_text(int col) const {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
  if (!p) return {};
  return std::string(p, (size_t)sqlite3_column_bytes(st_, col));
}

Connection::Connection(const StoreConfig& cfg) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if (sqlite3_open_v2(cfg.sqlite_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError("sqlite open failed (" + cfg.sqlite_path + "): " + msg);
  }
  sqlite3_busy_timeout(db_, cfg.busy_timeout_ms);
}

Connection::~Connection() {
  if (db_) sqlite3_close(db_);
}

void Connection::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StorageError("sqlite exec: " + e);
  }
}

int64_t Connection::last_insert_id() const {
  return (int64_t)sqlite3_last_insert_rowid(db_);
}
