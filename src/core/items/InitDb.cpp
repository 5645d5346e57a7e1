#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

constexpr int kSchemaVersion = 1;

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

std::string read_schema(const std::string& schemaPath) {
  std::ifstream in(schemaPath, std::ios::binary);
  if (!in) throw std::runtime_error("item schema not readable: " + schemaPath);
  std::ostringstream sql;
  sql << in.rdbuf();
  return sql.str();
}

void run_script(sqlite3* db, const std::string& sql, const char* stage) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error(std::string("item database ") + stage + ": " + detail);
  }
}

} // namespace

namespace wam {

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const std::string schema = read_schema(schemaPath);

  const auto dir = std::filesystem::path(dbPath).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("cannot open item database " + dbPath + ": " +
                             (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
  }

  // WAL keeps status reads from blocking pipeline writes.
  run_script(db.get(), "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA busy_timeout=5000;",
             "pragmas");
  run_script(db.get(), schema, "schema");
  run_script(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "version");
  return true;
}

} // namespace wam
