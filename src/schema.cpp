#include "schema.hpp"
#include "connection.hpp"

void ensure_schema(const StoreConfig& cfg) {
  // AUTOINCREMENT keeps ids from ever being handed out twice
  const char* sql =
    "CREATE TABLE IF NOT EXISTS expenses ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " date TEXT NOT NULL,"
    " amount REAL NOT NULL,"
    " category TEXT NOT NULL,"
    " subcategory TEXT DEFAULT '',"
    " note TEXT DEFAULT ''"
    ");";
  Connection conn(cfg);
  conn.exec(sql);
}
