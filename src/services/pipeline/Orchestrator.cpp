#include "Orchestrator.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/errors/ServiceError.hpp"
#include "core/image/FormatValidator.hpp"
#include "core/image/Resizer.hpp"
#include "core/items/StatusTracker.hpp"
#include "core/storage/StorageManager.hpp"
#include "core/storage/StoragePaths.hpp"
#include "core/util/Digest.hpp"
#include "core/util/Time.hpp"
#include "services/http/ImageDownloader.hpp"
#include "services/replicate/BackgroundRemover.hpp"
#include "services/replicate/ImageGenerator.hpp"

namespace wam {

// -------- helpers --------

namespace {

class Stopwatch {
public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}
  int64_t elapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_).count();
  }
private:
  std::chrono::steady_clock::time_point start_;
};

// Runs the final status write and turns a vanished record into NotFound.
void finish(StatusTracker& tracker, const std::string& assetId, const std::string& ownerId,
            const StoredObject& object) {
  if (assetId.empty()) return;
  if (tracker.completeOrDiscard(assetId, ownerId, object.publicUrl, object.path) == CompletionOutcome::Discarded) {
    throw NotFoundError("Wardrobe item was deleted during processing");
  }
}

} // namespace

PipelineSettings PipelineSettings::from_config(const Config& c) {
  PipelineSettings s;
  s.maxSourceBytes = c.maxSourceBytes;
  s.allowedMimeTypes = c.allowedMimeTypes;
  s.maxImageDimension = c.maxImageDimension;
  s.costUnitsPerGeneration = c.costUnitsPerGeneration;
  return s;
}

Orchestrator::Orchestrator(PipelineSettings settings,
                           StorageManager& storage,
                           StatusTracker& tracker,
                           ImageGenerator& generator,
                           BackgroundRemover& remover,
                           ImageDownloader& downloader)
  : settings_(std::move(settings)),
    storage_(storage),
    tracker_(tracker),
    generator_(generator),
    remover_(remover),
    downloader_(downloader) {}

void Orchestrator::validateUpload(const UploadRequest& req) const {
  if (req.ownerId.empty()) throw AuthError("Invalid authentication");
  if (req.imageBytes.empty()) throw ValidationError("No image file provided");

  if (static_cast<int64_t>(req.imageBytes.size()) > settings_.maxSourceBytes) {
    throw ValidationError("File size exceeds maximum allowed size (" +
                          std::to_string(settings_.maxSourceBytes / (1024 * 1024)) + "MB)");
  }

  const auto& allowed = settings_.allowedMimeTypes;
  if (std::find(allowed.begin(), allowed.end(), req.declaredMimeType) == allowed.end()) {
    std::string list;
    for (const auto& m : allowed) list += (list.empty() ? "" : ", ") + m;
    throw ValidationError("File type not supported. Allowed types: " + list);
  }

  if (!matchesDeclaredType(req.imageBytes, req.declaredMimeType)) {
    spdlog::warn("integrity rejection: owner={} declared={} size={} sha256={}",
                 req.ownerId, req.declaredMimeType, req.imageBytes.size(), sha256_hex(req.imageBytes));
    throw ValidationError("File content does not match declared MIME type");
  }
}

std::string Orchestrator::bestEffortResize(const std::string& bytes) const {
  try {
    return resizeToFit(bytes, settings_.maxImageDimension);
  } catch (const ImageDecodeError& e) {
    spdlog::warn("resize skipped, keeping original bytes: {}", e.what());
    return bytes;
  }
}

// -------- flow A: direct upload --------

PipelineResult Orchestrator::processUpload(const UploadRequest& req) {
  const Stopwatch timer;
  validateUpload(req);

  const int64_t ts = now_ms();
  const std::string processedKey = req.assetId.empty() ? std::to_string(ts) : req.assetId;
  const std::string processedTarget = processedPath(req.ownerId, processedKey, "png");

  if (!req.assetId.empty() && !tracker_.exists(req.assetId, req.ownerId)) {
    throw NotFoundError("Wardrobe item not found for user");
  }
  storage_.ensureBucket();

  const bool tracked = !req.assetId.empty();
  if (tracked) tracker_.markProcessing(req.assetId, req.ownerId);

  try {
    return runUpload(req, ts, processedTarget, timer.elapsedMs());
  } catch (const NotFoundError&) {
    throw;
  } catch (const ServiceError& e) {
    spdlog::error("upload pipeline for owner {} failed ({}): {}", req.ownerId, to_string(e.code()), e.what());
    if (tracked) tracker_.markFailed(req.assetId, req.ownerId, std::nullopt, e.what());
    throw;
  } catch (const std::exception& e) {
    spdlog::error("upload pipeline for owner {} failed unexpectedly: {}", req.ownerId, e.what());
    if (tracked) tracker_.markFailed(req.assetId, req.ownerId, std::nullopt, e.what());
    throw ServiceError(ErrorCode::InternalError, e.what());
  }
}

PipelineResult Orchestrator::runUpload(const UploadRequest& req, int64_t ts,
                                       const std::string& processedTarget, int64_t setupMs) {
  const Stopwatch timer;
  const auto elapsed = [&] { return setupMs + timer.elapsedMs(); };

  PipelineResult result;
  result.backgroundRemovalStatus = "completed";

  if (req.removeBackground && req.declaredMimeType == "image/png" && hasAlphaChannel(req.imageBytes)) {
    spdlog::info("upload for owner {} already has an alpha channel, skipping background removal", req.ownerId);
    const StoredObject stored = storage_.upload(processedTarget, req.imageBytes, "image/png");
    finish(tracker_, req.assetId, req.ownerId, stored);
    result.imageUrl = stored.publicUrl;
    result.storagePath = stored.path;
    result.message = "Image already has transparent background";
    result.processingTimeMs = elapsed();
    return result;
  }

  const StoredObject original = storage_.upload(
    originalPath(req.ownerId, ts, extensionForMimeType(req.declaredMimeType)),
    req.imageBytes, req.declaredMimeType);

  if (!req.removeBackground) {
    finish(tracker_, req.assetId, req.ownerId, original);
    result.imageUrl = original.publicUrl;
    result.storagePath = original.path;
    result.message = "Image uploaded successfully";
    result.processingTimeMs = elapsed();
    return result;
  }

  StoredObject processed;
  try {
    const std::string resultUrl = remover_.removeBackground(original.publicUrl);
    const DownloadedImage download = downloader_.fetch(resultUrl);
    if (!matchesDeclaredType(download.bytes, "image/png")) {
      throw ImageDecodeError("background removal result is not a PNG");
    }
    processed = storage_.upload(processedTarget, bestEffortResize(download.bytes), "image/png");
  } catch (const std::exception& e) {
    spdlog::error("background removal for owner {} failed, keeping original {}: {}",
                  req.ownerId, original.path, e.what());
    if (!req.assetId.empty()) tracker_.markFailed(req.assetId, req.ownerId, original.publicUrl, e.what());
    result.imageUrl = original.publicUrl;
    result.storagePath = original.path;
    result.backgroundRemovalStatus = "failed";
    result.message = "Image uploaded, background removal failed (original retained)";
    result.processingTimeMs = elapsed();
    return result;
  }

  storage_.remove({original.path});
  finish(tracker_, req.assetId, req.ownerId, processed);

  result.imageUrl = processed.publicUrl;
  result.storagePath = processed.path;
  result.message = "Background removed successfully";
  result.processingTimeMs = elapsed();
  return result;
}

// -------- flow B: generate from prompt --------

PipelineResult Orchestrator::generateFromPrompt(const GenerateRequest& req) {
  const Stopwatch timer;
  if (req.callerId.empty()) throw AuthError("Invalid authentication");
  if (req.assetId.empty() || req.ownerId.empty() || req.prompt.empty()) {
    throw ValidationError("Missing required fields: wardrobe_item_id, user_id, prompt");
  }
  if (req.ownerId != req.callerId) throw AuthError("User ID mismatch", 403);
  generatedPath(req.ownerId, req.assetId, "png");  // throws ValidationError for unusable ids
  if (!tracker_.exists(req.assetId, req.ownerId)) {
    throw NotFoundError("Wardrobe item not found for user");
  }
  storage_.ensureBucket();

  tracker_.markProcessing(req.assetId, req.ownerId);
  auto fail = [&](const std::string& reason) {
    tracker_.markFailed(req.assetId, req.ownerId, std::nullopt, reason);
  };

  try {
    GeneratedImage generated;
    try {
      generated = generator_.generate(req.prompt);
    } catch (const ServiceError&) {
      throw;
    } catch (const std::exception& e) {
      throw UpstreamError(ErrorCode::ReplicateError, e.what());
    }
    spdlog::info("generated image for item {} in {} ms", req.assetId, generated.duration.count());

    std::string transparentUrl;
    try {
      transparentUrl = remover_.removeBackground(generated.imageUrl);
    } catch (const UpstreamError& e) {
      if (e.code() == ErrorCode::BackgroundRemovalFailed) throw;
      throw UpstreamError(ErrorCode::BackgroundRemovalFailed, e.what(), e.upstreamStatus());
    } catch (const std::exception& e) {
      throw UpstreamError(ErrorCode::BackgroundRemovalFailed, e.what());
    }

    DownloadedImage download;
    try {
      download = downloader_.fetch(transparentUrl);
    } catch (const TransportError& e) {
      throw StorageError(e.what());
    }

    std::string mime = mimeTypeForContentType(download.contentType);
    if (!matchesDeclaredType(download.bytes, mime)) {
      const std::string sniffed = sniffImageType(download.bytes);
      if (sniffed.empty()) {
        spdlog::warn("removal result for item {} is not an image: content-type={} size={} sha256={}",
                     req.assetId, download.contentType, download.bytes.size(), sha256_hex(download.bytes));
        throw UpstreamError(ErrorCode::BackgroundRemovalFailed, "Background removal result is not a valid image");
      }
      spdlog::warn("removal result for item {} declared {} but contains {}", req.assetId, mime, sniffed);
      mime = sniffed;
    }
    const StoredObject stored = storage_.upload(
      generatedPath(req.ownerId, req.assetId, extensionForMimeType(mime)), download.bytes, mime);
    finish(tracker_, req.assetId, req.ownerId, stored);

    PipelineResult result;
    result.imageUrl = stored.publicUrl;
    result.storagePath = stored.path;
    result.generationDurationMs = generated.duration.count();
    result.costUnits = settings_.costUnitsPerGeneration;
    result.backgroundRemovalStatus = "completed";
    result.message = "Wardrobe item image generated";
    result.processingTimeMs = timer.elapsedMs();
    return result;
  } catch (const NotFoundError&) {
    throw;
  } catch (const ServiceError& e) {
    spdlog::error("generation pipeline for item {} failed ({}): {}", req.assetId, to_string(e.code()), e.what());
    fail(e.what());
    throw;
  } catch (const std::exception& e) {
    spdlog::error("generation pipeline for item {} failed unexpectedly: {}", req.assetId, e.what());
    fail(e.what());
    throw ServiceError(ErrorCode::InternalError, e.what());
  }
}

} // namespace wam
