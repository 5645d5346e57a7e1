#pragma once
#include <optional>
#include <string>

#include "ItemStore.hpp"

namespace wam {

class StorageManager;

enum class CompletionOutcome {
  Completed,   // record marked completed
  Discarded,   // record gone; the uploaded object was removed
  WriteFailed, // record present but the status write failed (logged)
};

// Writes pipeline transitions to the owning item record and keeps an
// audit trail. Store failures are logged and reported as `false`; they never
// interrupt the pipeline.
class StatusTracker {
public:
  StatusTracker(ItemStore& items, StorageManager& storage);

  // Writes only the populated fields of `update`, scoped by (assetId, ownerId).
  bool setStatus(const std::string& assetId,
                 const std::string& ownerId,
                 const StatusUpdate& update,
                 const std::string& event = "status");

  bool markProcessing(const std::string& assetId, const std::string& ownerId);

  // `imageUrl` (when given) is the best asset available; without it the
  // record keeps whatever image it already had.
  bool markFailed(const std::string& assetId,
                  const std::string& ownerId,
                  const std::optional<std::string>& imageUrl,
                  const std::string& reason);

  // Final write. Re-reads the record first: when it no longer exists the
  // just-uploaded object at `storagePath` is removed instead.
  CompletionOutcome completeOrDiscard(const std::string& assetId,
                         const std::string& ownerId,
                         const std::string& imageUrl,
                         const std::string& storagePath);

  // Ownership check used before any work starts. Store failures propagate.
  bool exists(const std::string& assetId, const std::string& ownerId);

private:
  void record(const std::string& assetId, const std::string& event, const std::string& detailsJson);

  ItemStore& items_;
  StorageManager& storage_;
};

} // namespace wam
