#include "SqliteItemStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

#include "core/util/Time.hpp"

namespace {

// Finalizes on scope exit; errors are reported by the caller via sqlite3_errmsg.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql, const char* what) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw std::runtime_error(std::string(what) + " prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  void text(int i, const std::string& v) { sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT); }
  void i64(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void null(int i) { sqlite3_bind_null(st_, i); }

private:
  sqlite3_stmt* st_ = nullptr;
};

std::optional<int64_t> column_i64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, col);
}

std::optional<std::string> column_text(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st, col)));
}

// For "... RETURNING" statements: true when at least one row came back.
bool step_returning(sqlite3* db, Statement& st, const char* what) {
  int rc = sqlite3_step(st.get());
  const bool any = rc == SQLITE_ROW;
  while (rc == SQLITE_ROW) rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
  return any;
}

void step_done(sqlite3* db, Statement& st, const char* what) {
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

} // namespace

namespace wam {

SqliteItemStore::SqliteItemStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + err);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SqliteItemStore::~SqliteItemStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

std::optional<ItemRecord> SqliteItemStore::findItem(const std::string& id,
                                                    const std::string& ownerId) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT id, user_id, processing_status, processing_started_at,
           processing_completed_at, image_url
      FROM wardrobe_items
     WHERE id = ? AND user_id = ?
  )SQL", "findItem");
  st.text(1, id);
  st.text(2, ownerId);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("findItem failed: ") + sqlite3_errmsg(db));

  ItemRecord r;
  r.id          = *column_text(st.get(), 0);
  r.ownerId     = *column_text(st.get(), 1);
  r.status      = parse_processing_status(column_text(st.get(), 2).value_or(""))
                    .value_or(ProcessingStatus::Pending);
  r.startedAt   = column_i64(st.get(), 3);
  r.completedAt = column_i64(st.get(), 4);
  r.imageUrl    = column_text(st.get(), 5);
  return r;
}

bool SqliteItemStore::updateStatus(const std::string& id,
                                   const std::string& ownerId,
                                   const StatusUpdate& u) {
  auto* db = static_cast<sqlite3*>(db_);

  std::string sql = "UPDATE wardrobe_items SET processing_status = ?, updated_at = ?";
  if (u.startedAt) sql += ", processing_started_at = ?";
  if (u.completedAt) sql += ", processing_completed_at = ?";
  else if (u.clearCompletedAt) sql += ", processing_completed_at = NULL";
  if (u.imageUrl) sql += ", image_url = ?";
  sql += " WHERE id = ? AND user_id = ? RETURNING id";

  Statement st(db, sql, "updateStatus");
  int i=1;
  st.text(i++, to_string(u.status));
  st.i64(i++, now_ms());
  if (u.startedAt) st.i64(i++, *u.startedAt);
  if (u.completedAt) st.i64(i++, *u.completedAt);
  if (u.imageUrl) st.text(i++, *u.imageUrl);
  st.text(i++, id);
  st.text(i++, ownerId);

  return step_returning(db, st, "updateStatus");
}

void SqliteItemStore::appendHistory(const std::string& itemId,
                                    const std::string& event,
                                    const std::string& detailsJson,
                                    int64_t at,
                                    const std::string& actor) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO item_processing_history (item_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL", "appendHistory");
  st.text(1, itemId);
  st.text(2, event);
  st.text(3, detailsJson);
  st.i64(4, at);
  st.text(5, actor);
  step_done(db, st, "appendHistory");
}

void SqliteItemStore::insertItem(const ItemRecord& r, const std::string& name) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO wardrobe_items
      (id, user_id, name, processing_status, processing_started_at,
       processing_completed_at, image_url, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL", "insertItem");
  const int64_t now = now_ms();
  int i=1;
  st.text(i++, r.id);
  st.text(i++, r.ownerId);
  st.text(i++, name);
  st.text(i++, to_string(r.status));
  if (r.startedAt) st.i64(i++, *r.startedAt); else st.null(i++);
  if (r.completedAt) st.i64(i++, *r.completedAt); else st.null(i++);
  if (r.imageUrl) st.text(i++, *r.imageUrl); else st.null(i++);
  st.i64(i++, now);
  st.i64(i++, now);
  step_done(db, st, "insertItem");
}

bool SqliteItemStore::deleteItem(const std::string& id, const std::string& ownerId) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "DELETE FROM wardrobe_items WHERE id = ? AND user_id = ? RETURNING id", "deleteItem");
  st.text(1, id);
  st.text(2, ownerId);
  return step_returning(db, st, "deleteItem");
}

std::vector<HistoryEntry> SqliteItemStore::history(const std::string& itemId) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT item_id, event, details, at, actor
      FROM item_processing_history
     WHERE item_id = ?
     ORDER BY seq
  )SQL", "history");
  st.text(1, itemId);

  std::vector<HistoryEntry> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    HistoryEntry e;
    e.itemId      = column_text(st.get(), 0).value_or("");
    e.event       = column_text(st.get(), 1).value_or("");
    e.detailsJson = column_text(st.get(), 2).value_or("{}");
    e.at          = sqlite3_column_int64(st.get(), 3);
    e.actor       = column_text(st.get(), 4).value_or("");
    out.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("history failed: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace wam
