#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ItemStore.hpp"

namespace wam {

struct HistoryEntry {
  std::string itemId;
  std::string event;
  std::string detailsJson;
  int64_t     at = 0;
  std::string actor;
};

// SQLite-backed ItemStore. The schema must already be applied (initDatabase).
// The connection is opened in serialized mode and may be shared by the
// server's worker threads.
class SqliteItemStore : public ItemStore {
public:
  explicit SqliteItemStore(const std::string& dbPath);
  ~SqliteItemStore() override;

  SqliteItemStore(const SqliteItemStore&) = delete;
  SqliteItemStore& operator=(const SqliteItemStore&) = delete;

  std::optional<ItemRecord> findItem(const std::string& id,
                                     const std::string& ownerId) override;
  bool updateStatus(const std::string& id,
                    const std::string& ownerId,
                    const StatusUpdate& update) override;
  void appendHistory(const std::string& itemId,
                     const std::string& event,
                     const std::string& detailsJson,
                     int64_t at,
                     const std::string& actor) override;

  void insertItem(const ItemRecord& r, const std::string& name = "");
  bool deleteItem(const std::string& id, const std::string& ownerId);
  std::vector<HistoryEntry> history(const std::string& itemId);

private:
  void* db_; // sqlite3*
};

} // namespace wam
