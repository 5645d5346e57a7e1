#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace wam {

enum class StorageBackendKind { Local, Supabase };

struct Config {
  // service
  std::string dbPath       = "data/wardrobe-items.db";
  std::string schemaPath;  // empty = search next to the binary / source tree
  int         port         = 8080;
  std::string logLevel     = "info";

  // storage
  std::string bucketName       = "wardrobe-images";
  int64_t     maxSourceBytes   = 5 * 1024 * 1024;
  int64_t     maxStorageBytes  = 10 * 1024 * 1024;
  std::vector<std::string> allowedMimeTypes{"image/jpeg", "image/png", "image/webp"};
  StorageBackendKind storageBackend = StorageBackendKind::Local;
  std::string storageRoot      = "data/objects";
  std::string publicBaseUrl    = "http://localhost:8080/storage";
  std::string supabaseUrl;
  std::string supabaseServiceKey;

  // image processing
  int maxImageDimension = 1024;
  int costUnitsPerGeneration = 5;

  // replicate
  std::string replicateToken;
  std::string replicateBaseUrl = "https://api.replicate.com";
  std::string generationVersion;  // pinned text-to-image version, tried first
  std::vector<std::string> generationModels{"google/imagen-4", "google-deepmind/imagen-4"};
  std::string bgModel = "851-labs/background-remover";
  std::string modelVersion;       // pinned background-removal version
  int maxBgRemovalAttempts = 3;

  // auth
  std::map<std::string, std::string> authTokens;  // token -> user id
};

// Reads the WAM_* / REPLICATE_* / SUPABASE_* environment into a Config.
// Malformed numbers keep their defaults (logged).
Config load_config_from_env();

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_list(const std::string& s, char sep = ',');

// "tok1=alice,tok2=bob" -> {{"tok1","alice"},{"tok2","bob"}}; bad pairs skipped.
std::map<std::string, std::string> parse_token_map(const std::string& s);

std::string get_env_or(const char* key, const std::string& defval);

} // namespace wam
