// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/items/InitDb.hpp"
#include "core/items/SqliteItemStore.hpp"
#include "core/items/StatusTracker.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/StorageManager.hpp"
#include "core/storage/SupabaseStorageBackend.hpp"
#include "services/api/HttpServer.hpp"
#include "services/auth/StaticTokenAuthenticator.hpp"
#include "services/auth/SupabaseAuthenticator.hpp"
#include "services/http/HttplibTransport.hpp"
#include "services/http/ImageDownloader.hpp"
#include "services/pipeline/Orchestrator.hpp"
#include "services/replicate/BackgroundRemovalClient.hpp"
#include "services/replicate/GenerationClient.hpp"

// ---------- helpers ----------

// WAM_SCHEMA_PATH wins; otherwise look in CWD (CI copies it there), then the source tree.
static std::string findSchemaPath(const wam::Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw std::runtime_error("WAM_SCHEMA_PATH does not exist: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/items/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/items)");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (WAM_PORT or 8080)\n";
}

static void prepare_database(const wam::Config& cfg) {
  const std::string schemaPath = findSchemaPath(cfg);
  ensure_dirs_for(cfg.dbPath);
  wam::initDatabase(cfg.dbPath, schemaPath);
}

static int serve(const wam::Config& cfg) {
  // Self-heal DB on startup (idempotent)
  prepare_database(cfg);

  wam::HttplibTransport http;

  std::unique_ptr<wam::ObjectStore> objects;
  std::string mountDir;
  if (cfg.storageBackend == wam::StorageBackendKind::Supabase) {
    if (cfg.supabaseUrl.empty() || cfg.supabaseServiceKey.empty()) {
      throw std::runtime_error("supabase storage needs SUPABASE_URL and SUPABASE_SERVICE_ROLE_KEY");
    }
    objects = std::make_unique<wam::SupabaseStorageBackend>(http, cfg.supabaseUrl, cfg.supabaseServiceKey);
  } else {
    auto local = std::make_unique<wam::LocalFSBackend>(cfg.storageRoot, cfg.publicBaseUrl);
    mountDir = local->bucketDir(cfg.bucketName);
    std::filesystem::create_directories(mountDir);
    objects = std::move(local);
  }

  std::unique_ptr<wam::Authenticator> auth;
  if (!cfg.authTokens.empty()) {
    auth = std::make_unique<wam::StaticTokenAuthenticator>(cfg.authTokens);
  } else if (!cfg.supabaseUrl.empty() && !cfg.supabaseServiceKey.empty()) {
    auth = std::make_unique<wam::SupabaseAuthenticator>(http, cfg.supabaseUrl, cfg.supabaseServiceKey);
  } else {
    throw std::runtime_error("no authenticator configured (set WAM_AUTH_TOKENS or SUPABASE_URL)");
  }
  if (cfg.replicateToken.empty()) {
    spdlog::warn("REPLICATE_API_TOKEN not set; generation and background removal will fail");
  }

  // Construct services
  wam::BucketPolicy policy;
  policy.name = cfg.bucketName;
  policy.isPublic = true;
  policy.fileSizeLimit = cfg.maxStorageBytes;
  policy.allowedMimeTypes = cfg.allowedMimeTypes;

  wam::SqliteItemStore items(cfg.dbPath);
  wam::StorageManager storage(*objects, policy);
  wam::StatusTracker tracker(items, storage);
  wam::GenerationClient generator(http, wam::GenerationSettings::from_config(cfg));
  wam::BackgroundRemovalClient removalClient(http, wam::BackgroundRemovalSettings::from_config(cfg));
  wam::RetryingBackgroundRemover remover(removalClient, cfg.maxBgRemovalAttempts);
  wam::ImageDownloader downloader(http);

  wam::Orchestrator pipeline(wam::PipelineSettings::from_config(cfg),
                             storage, tracker, generator, remover, downloader);
  wam::ApiHandlers api(pipeline, *auth);

  wam::run_http_server(api, cfg.port, "/storage/" + cfg.bucketName, mountDir);
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const wam::Config cfg = wam::load_config_from_env();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      prepare_database(cfg);
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      return serve(cfg);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
