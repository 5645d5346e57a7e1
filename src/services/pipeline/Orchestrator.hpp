#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wam {

struct Config;
class StorageManager;
class StatusTracker;
class ImageGenerator;
class BackgroundRemover;
class ImageDownloader;

struct PipelineSettings {
  int64_t maxSourceBytes = 5 * 1024 * 1024;
  std::vector<std::string> allowedMimeTypes{"image/jpeg", "image/png", "image/webp"};
  int maxImageDimension = 1024;
  int costUnitsPerGeneration = 5;

  static PipelineSettings from_config(const Config& c);
};

// Direct upload. `ownerId` is the authenticated caller; `assetId` is optional.
struct UploadRequest {
  std::string assetId;
  std::string ownerId;
  std::string imageBytes;
  std::string declaredMimeType;
  bool removeBackground = true;
};

// Generate-from-prompt. `ownerId` is the user named in the request body and
// must equal `callerId`.
struct GenerateRequest {
  std::string callerId;
  std::string assetId;
  std::string ownerId;
  std::string prompt;
};

struct PipelineResult {
  bool success = true;
  std::string imageUrl;
  std::string storagePath;
  std::optional<int64_t> generationDurationMs;
  std::optional<int> costUnits;
  std::string backgroundRemovalStatus;  // "completed" | "failed"
  std::string message;
  int64_t processingTimeMs = 0;
};

// Runs both pipeline flows. Rejections (ValidationError, AuthError,
// NotFoundError) are thrown before any external call; after that every run
// leaves the item in `completed` or `failed`.
class Orchestrator {
public:
  Orchestrator(PipelineSettings settings,
               StorageManager& storage,
               StatusTracker& tracker,
               ImageGenerator& generator,
               BackgroundRemover& remover,
               ImageDownloader& downloader);

  // Flow A. A failed background removal is a partial success: the item
  // keeps the original image and the result reports "failed".
  PipelineResult processUpload(const UploadRequest& req);

  // Flow B. Generation and removal failures are hard failures
  // (UpstreamError with REPLICATE_ERROR / BACKGROUND_REMOVAL_FAILED).
  PipelineResult generateFromPrompt(const GenerateRequest& req);

private:
  void validateUpload(const UploadRequest& req) const;
  // Storage and removal stages of processUpload, after the item is marked processing.
  PipelineResult runUpload(const UploadRequest& req, int64_t ts,
                           const std::string& processedTarget, int64_t setupMs);
  std::string bestEffortResize(const std::string& bytes) const;

  PipelineSettings settings_;
  StorageManager& storage_;
  StatusTracker& tracker_;
  ImageGenerator& generator_;
  BackgroundRemover& remover_;
  ImageDownloader& downloader_;
};

} // namespace wam
