#pragma once
#include <cstdint>
#include <string>

namespace wam {

// Deterministic object paths.
//   original/<owner>/<timestamp_ms>.<ext>          pre-removal upload, never overwritten
//   processed/<owner>/<key>.<ext>                  final asset, overwritten on regeneration
//   processed/<owner>/generated/<asset>.<ext>      prompt-generated asset
// Owner and asset ids must be single path segments (ValidationError otherwise).

std::string originalPath(const std::string& ownerId, int64_t timestampMs, const std::string& ext);
std::string processedPath(const std::string& ownerId, const std::string& key, const std::string& ext);
std::string generatedPath(const std::string& ownerId, const std::string& assetId, const std::string& ext);

bool isOriginalPath(const std::string& path);

} // namespace wam
