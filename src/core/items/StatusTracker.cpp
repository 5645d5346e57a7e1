#include "StatusTracker.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/storage/StorageManager.hpp"
#include "core/util/Time.hpp"

using nlohmann::json;

namespace wam {

StatusTracker::StatusTracker(ItemStore& items, StorageManager& storage)
  : items_(items), storage_(storage) {}

bool StatusTracker::setStatus(const std::string& assetId,
                              const std::string& ownerId,
                              const StatusUpdate& update,
                              const std::string& event) {
  bool changed = false;
  try {
    changed = items_.updateStatus(assetId, ownerId, update);
  } catch (const std::exception& e) {
    spdlog::error("status write {} -> {} failed: {}", assetId, to_string(update.status), e.what());
    return false;
  }
  if (!changed) {
    spdlog::warn("status write {} -> {} matched no record for owner {}",
                 assetId, to_string(update.status), ownerId);
    return false;
  }

  json details = {{"status", to_string(update.status)}};
  if (update.imageUrl) details["image_url"] = *update.imageUrl;
  record(assetId, event, details.dump());
  return true;
}

bool StatusTracker::markProcessing(const std::string& assetId, const std::string& ownerId) {
  StatusUpdate u;
  u.status = ProcessingStatus::Processing;
  u.startedAt = now_ms();
  u.clearCompletedAt = true;
  return setStatus(assetId, ownerId, u, "processing_started");
}

bool StatusTracker::markFailed(const std::string& assetId,
                               const std::string& ownerId,
                               const std::optional<std::string>& imageUrl,
                               const std::string& reason) {
  StatusUpdate u;
  u.status = ProcessingStatus::Failed;
  u.completedAt = now_ms();
  u.imageUrl = imageUrl;
  const bool ok = setStatus(assetId, ownerId, u, "processing_failed");
  if (ok) record(assetId, "failure_reason", json({{"reason", reason}}).dump());
  return ok;
}

CompletionOutcome StatusTracker::completeOrDiscard(const std::string& assetId,
                                      const std::string& ownerId,
                                      const std::string& imageUrl,
                                      const std::string& storagePath) {
  bool present = true;
  try {
    present = exists(assetId, ownerId);
  } catch (const std::exception& e) {
    // Unknown counts as present so a store hiccup never deletes output.
    spdlog::error("lookup of item {} failed: {}", assetId, e.what());
  }
  if (!present) {
    spdlog::info("item {} deleted during processing, removing {}", assetId, storagePath);
    storage_.remove({storagePath});
    record(assetId, "output_discarded", json({{"storage_path", storagePath}}).dump());
    return CompletionOutcome::Discarded;
  }

  StatusUpdate u;
  u.status = ProcessingStatus::Completed;
  u.completedAt = now_ms();
  u.imageUrl = imageUrl;
  return setStatus(assetId, ownerId, u, "processing_completed") ? CompletionOutcome::Completed
                                                                : CompletionOutcome::WriteFailed;
}

bool StatusTracker::exists(const std::string& assetId, const std::string& ownerId) {
  return items_.findItem(assetId, ownerId).has_value();
}

void StatusTracker::record(const std::string& assetId, const std::string& event, const std::string& detailsJson) {
  try {
    items_.appendHistory(assetId, event, detailsJson, now_ms(), "pipeline");
  } catch (const std::exception& e) {
    spdlog::warn("history append for {} failed: {}", assetId, e.what());
  }
}

} // namespace wam
