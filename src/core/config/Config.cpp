#include "Config.hpp"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

int64_t env_int_or(const char* key, int64_t defval) {
  const std::string raw = wam::get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    return std::stoll(raw);
  } catch (const std::exception&) {
    spdlog::warn("ignoring non-numeric {}={}", key, raw);
    return defval;
  }
}

} // namespace

namespace wam {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

std::vector<std::string> split_list(const std::string& s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    auto end = s.find(sep, start);
    if (end == std::string::npos) end = s.size();
    auto item = trim(s.substr(start, end - start));
    if (!item.empty()) out.push_back(std::move(item));
    start = end + 1;
  }
  return out;
}

std::map<std::string, std::string> parse_token_map(const std::string& s) {
  std::map<std::string, std::string> out;
  for (const auto& pair : split_list(s)) {
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == pair.size()) {
      spdlog::warn("skipping malformed auth token entry");
      continue;
    }
    out[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
  }
  return out;
}

Config load_config_from_env() {
  Config c;
  c.dbPath     = get_env_or("WAM_DB_PATH", c.dbPath);
  c.schemaPath = get_env_or("WAM_SCHEMA_PATH", c.schemaPath);
  c.port       = static_cast<int>(env_int_or("WAM_PORT", c.port));
  c.logLevel   = get_env_or("WAM_LOG_LEVEL", c.logLevel);

  c.bucketName      = get_env_or("WAM_BUCKET", c.bucketName);
  c.maxSourceBytes  = env_int_or("WAM_MAX_SOURCE_BYTES", c.maxSourceBytes);
  c.maxStorageBytes = env_int_or("WAM_MAX_STORAGE_BYTES", c.maxStorageBytes);
  if (auto types = split_list(get_env_or("WAM_ALLOWED_MIME_TYPES", "")); !types.empty()) {
    c.allowedMimeTypes = std::move(types);
  }

  const std::string backend = get_env_or("WAM_STORAGE_BACKEND", "local");
  if (backend == "supabase") {
    c.storageBackend = StorageBackendKind::Supabase;
  } else if (backend != "local") {
    throw std::runtime_error("WAM_STORAGE_BACKEND must be 'local' or 'supabase', got: " + backend);
  }
  c.storageRoot        = get_env_or("WAM_STORAGE_ROOT", c.storageRoot);
  c.publicBaseUrl      = get_env_or("WAM_PUBLIC_BASE_URL",
                                    "http://localhost:" + std::to_string(c.port) + "/storage");
  c.supabaseUrl        = get_env_or("SUPABASE_URL", "");
  c.supabaseServiceKey = get_env_or("SUPABASE_SERVICE_ROLE_KEY", "");

  c.maxImageDimension      = static_cast<int>(env_int_or("WAM_MAX_IMAGE_DIMENSION", c.maxImageDimension));
  c.costUnitsPerGeneration = static_cast<int>(env_int_or("WAM_COST_UNITS", c.costUnitsPerGeneration));

  c.replicateToken    = get_env_or("REPLICATE_API_TOKEN", "");
  c.replicateBaseUrl  = get_env_or("WAM_REPLICATE_BASE_URL", c.replicateBaseUrl);
  c.generationVersion = get_env_or("REPLICATE_IMAGEN_VERSION", "");
  if (auto models = split_list(get_env_or("WAM_GENERATION_MODELS", "")); !models.empty()) {
    c.generationModels = std::move(models);
  }
  c.bgModel              = get_env_or("REPLICATE_BG_MODEL", c.bgModel);
  c.modelVersion         = get_env_or("REPLICATE_BG_VERSION", "");
  c.maxBgRemovalAttempts = static_cast<int>(env_int_or("WAM_BG_MAX_ATTEMPTS", c.maxBgRemovalAttempts));
  if (c.maxBgRemovalAttempts < 1) c.maxBgRemovalAttempts = 1;

  c.authTokens = parse_token_map(get_env_or("WAM_AUTH_TOKENS", ""));
  return c;
}

} // namespace wam
