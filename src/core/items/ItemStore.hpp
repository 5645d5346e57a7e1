#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wam {

enum class ProcessingStatus { Pending, Processing, Completed, Failed };

const char* to_string(ProcessingStatus s);
std::optional<ProcessingStatus> parse_processing_status(std::string_view s);

// The slice of a wardrobe item the pipeline reads and writes.
struct ItemRecord {
  std::string id;
  std::string ownerId;
  ProcessingStatus status = ProcessingStatus::Pending;
  std::optional<int64_t> startedAt;     // epoch ms
  std::optional<int64_t> completedAt;   // epoch ms
  std::optional<std::string> imageUrl;
};

// Only the populated fields are written. `status` is always written.
struct StatusUpdate {
  ProcessingStatus status = ProcessingStatus::Pending;
  std::optional<int64_t> startedAt;
  std::optional<int64_t> completedAt;
  bool clearCompletedAt = false;        // ignored when completedAt is set
  std::optional<std::string> imageUrl;
};

// The external item store. Every lookup and write is scoped by owner.
class ItemStore {
public:
  virtual ~ItemStore() = default;

  virtual std::optional<ItemRecord> findItem(const std::string& id,
                                             const std::string& ownerId) = 0;

  // Returns true when a row with (id, ownerId) was changed. Throws
  // std::runtime_error on store failures.
  virtual bool updateStatus(const std::string& id,
                            const std::string& ownerId,
                            const StatusUpdate& update) = 0;

  virtual void appendHistory(const std::string& itemId,
                             const std::string& event,
                             const std::string& detailsJson,
                             int64_t at,
                             const std::string& actor) = 0;
};

} // namespace wam
