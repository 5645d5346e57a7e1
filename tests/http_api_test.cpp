#include "services/api/HttpServer.hpp"

#include <gtest/gtest.h>

#include <memory>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/errors/ServiceError.hpp"
#include "core/items/InitDb.hpp"
#include "core/items/SqliteItemStore.hpp"
#include "core/items/StatusTracker.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/StorageManager.hpp"
#include "services/api/ResponseJson.hpp"
#include "services/auth/StaticTokenAuthenticator.hpp"
#include "services/auth/SupabaseAuthenticator.hpp"
#include "services/http/ImageDownloader.hpp"
#include "services/pipeline/Orchestrator.hpp"
#include "services/replicate/BackgroundRemover.hpp"
#include "services/replicate/ImageGenerator.hpp"

using namespace wam;
using nlohmann::json;

namespace {

class StubGenerator : public ImageGenerator {
public:
  GeneratedImage generate(const std::string&) override {
    ++calls;
    return {"https://replicate.test/generated.png", std::chrono::milliseconds(10)};
  }
  int calls = 0;
};

class StubRemover : public BackgroundRemover {
public:
  std::string removeBackground(const std::string&) override {
    if (!error.empty()) throw UpstreamError(ErrorCode::BackgroundRemovalFailed, error, 503);
    return "https://replicate.test/clear.png";
  }
  std::string error;
};

class ApiHandlersTest : public ::testing::Test {
protected:
  void SetUp() override {
    const std::string dbPath = (dir_.path() / "items.db").string();
    initDatabase(dbPath, WAM_SCHEMA_FILE);
    items_ = std::make_unique<SqliteItemStore>(dbPath);
    ItemRecord r;
    r.id = "item-1";
    r.ownerId = "alice";
    items_->insertItem(r);

    objects_ = std::make_unique<LocalFSBackend>((dir_.path() / "objects").string(), "http://files.test");
    BucketPolicy policy;
    policy.name = "wardrobe-images";
    storage_ = std::make_unique<StorageManager>(*objects_, policy);
    tracker_ = std::make_unique<StatusTracker>(*items_, *storage_);

    const std::string png = test::make_png(8, 8, true);
    http_.handler = [png](const HttpRequest&) {
      HttpResponse res;
      res.status = 200;
      res.body = png;
      res.headers["content-type"] = "image/png";
      return res;
    };
    downloader_ = std::make_unique<ImageDownloader>(http_);
    orchestrator_ = std::make_unique<Orchestrator>(PipelineSettings{}, *storage_, *tracker_, generator_,
                                                   remover_, *downloader_);
    api_ = std::make_unique<ApiHandlers>(*orchestrator_, auth_);
  }

  httplib::Request post(const std::string& path, const std::string& body, const std::string& token = "tok-alice") {
    httplib::Request req;
    req.method = "POST";
    req.path = path;
    req.body = body;
    if (!token.empty()) req.headers.emplace("Authorization", "Bearer " + token);
    req.headers.emplace("Content-Type", "application/json");
    return req;
  }

  test::TempDir dir_;
  test::FakeTransport http_;
  StubGenerator generator_;
  StubRemover remover_;
  StaticTokenAuthenticator auth_{{{"tok-alice", "alice"}, {"tok-bob", "bob"}}};
  std::unique_ptr<SqliteItemStore> items_;
  std::unique_ptr<LocalFSBackend> objects_;
  std::unique_ptr<StorageManager> storage_;
  std::unique_ptr<StatusTracker> tracker_;
  std::unique_ptr<ImageDownloader> downloader_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::unique_ptr<ApiHandlers> api_;
};

} // namespace

TEST_F(ApiHandlersTest, Health) {
  httplib::Request req;
  httplib::Response res;
  api_->health(req, res);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, "ok");
}

TEST_F(ApiHandlersTest, MissingOrUnknownTokenIs401) {
  const std::string body = R"({"wardrobe_item_id":"item-1","user_id":"alice","prompt":"p"})";
  for (const std::string token : {"", "tok-nobody"}) {
    httplib::Response res;
    api_->generateItemImage(post("/generate-wardrobe-item-image", body, token), res);
    EXPECT_EQ(res.status, 401);
    const auto j = json::parse(res.body);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_code"], "AUTH_FAILED");
  }
  EXPECT_EQ(generator_.calls, 0);
}

TEST_F(ApiHandlersTest, GenerateErrorMapping) {
  struct Case {
    std::string body;
    std::string token;
    int status;
    std::string code;
  };
  const Case cases[] = {
    {"not json", "tok-alice", 400, "VALIDATION_ERROR"},
    {R"({"wardrobe_item_id":"item-1","user_id":"alice"})", "tok-alice", 400, "VALIDATION_ERROR"},
    {R"({"wardrobe_item_id":"item-1","user_id":"alice","prompt":"p"})", "tok-bob", 403, "AUTH_FAILED"},
    {R"({"wardrobe_item_id":"item-2","user_id":"alice","prompt":"p"})", "tok-alice", 404, "NOT_FOUND"},
  };
  for (const auto& c : cases) {
    httplib::Response res;
    api_->generateItemImage(post("/generate-wardrobe-item-image", c.body, c.token), res);
    EXPECT_EQ(res.status, c.status) << c.body;
    EXPECT_EQ(json::parse(res.body)["error_code"], c.code) << c.body;
  }
  EXPECT_EQ(generator_.calls, 0);
}

TEST_F(ApiHandlersTest, GenerateSuccessShape) {
  httplib::Response res;
  api_->generateItemImage(
    post("/generate-wardrobe-item-image", R"({"wardrobe_item_id":"item-1","user_id":"alice","prompt":"navy blazer"})"),
    res);

  ASSERT_EQ(res.status, 200) << res.body;
  const auto j = json::parse(res.body);
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["storage_path"], "processed/alice/generated/item-1.png");
  EXPECT_EQ(j["image_url"], "http://files.test/wardrobe-images/processed/alice/generated/item-1.png");
  EXPECT_EQ(j["cost_units"], 5);
  EXPECT_EQ(j["generation_duration_ms"], 10);
  EXPECT_EQ(j["background_removal_status"], "completed");
}

TEST_F(ApiHandlersTest, RemovalFailureAfterGenerationIs502) {
  remover_.error = "background remover unavailable";

  httplib::Response res;
  api_->generateItemImage(
    post("/generate-wardrobe-item-image", R"({"wardrobe_item_id":"item-1","user_id":"alice","prompt":"navy blazer"})"),
    res);

  EXPECT_EQ(res.status, 502);
  const auto j = json::parse(res.body);
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error_code"], "BACKGROUND_REMOVAL_FAILED");
  EXPECT_EQ(j["error"], "background remover unavailable");
  EXPECT_EQ(generator_.calls, 1);
  EXPECT_EQ(items_->findItem("item-1", "alice")->status, ProcessingStatus::Failed);
}

TEST_F(ApiHandlersTest, NonImageRemovalResultIs502) {
  http_.handler = [](const HttpRequest&) {
    HttpResponse res;
    res.status = 200;
    res.body = "<html>upstream error page</html>";
    res.headers["content-type"] = "image/png";
    return res;
  };

  httplib::Response res;
  api_->generateItemImage(
    post("/generate-wardrobe-item-image", R"({"wardrobe_item_id":"item-1","user_id":"alice","prompt":"navy blazer"})"),
    res);

  EXPECT_EQ(res.status, 502);
  EXPECT_EQ(json::parse(res.body)["error_code"], "BACKGROUND_REMOVAL_FAILED");
  EXPECT_EQ(items_->findItem("item-1", "alice")->status, ProcessingStatus::Failed);
}

TEST_F(ApiHandlersTest, ProcessImageFromMultipartForm) {
  httplib::Request req = post("/process-image", "");
  req.headers.erase("Content-Type");
  req.headers.emplace("Content-Type", "multipart/form-data; boundary=xyz");
  req.files.emplace("image", httplib::MultipartFormData{"image", test::make_png(16, 16, false), "shirt.png", "image/png"});
  req.files.emplace("removeBackground", httplib::MultipartFormData{"removeBackground", "false", "", ""});

  httplib::Response res;
  api_->processImage(req, res);

  ASSERT_EQ(res.status, 200) << res.body;
  const auto j = json::parse(res.body);
  EXPECT_EQ(j["message"], "Image uploaded successfully");
  EXPECT_EQ(j["storage_path"].get<std::string>().rfind("original/alice/", 0), 0u);
}

TEST_F(ApiHandlersTest, ProcessImageWithoutFileIs400) {
  httplib::Response res;
  api_->processImage(post("/process-image", ""), res);
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(json::parse(res.body)["error"], "No image file provided");
}

TEST_F(ApiHandlersTest, WrongMethodIs405) {
  httplib::Request req;
  req.method = "GET";
  httplib::Response res;
  api_->methodNotAllowed(req, res);
  EXPECT_EQ(res.status, 405);
  EXPECT_EQ(json::parse(res.body)["error_code"], "METHOD_NOT_ALLOWED");
}

TEST(ResponseJsonTest, PartialSuccessOmitsGenerationFields) {
  PipelineResult r;
  r.imageUrl = "http://files.test/original.jpg";
  r.backgroundRemovalStatus = "failed";
  r.message = "Image uploaded, background removal failed (original retained)";

  const auto j = result_to_json(r);
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["background_removal_status"], "failed");
  EXPECT_FALSE(j.contains("cost_units"));
  EXPECT_FALSE(j.contains("generation_duration_ms"));
  EXPECT_FALSE(j.contains("storage_path"));

  const auto e = error_to_json(ErrorCode::BackgroundRemovalFailed, "model overloaded");
  EXPECT_EQ(e["success"], false);
  EXPECT_EQ(e["error_code"], "BACKGROUND_REMOVAL_FAILED");
  EXPECT_EQ(e["error"], "model overloaded");
}

TEST(AuthenticatorTest, BearerTokenParsing) {
  EXPECT_EQ(bearer_token("Bearer abc"), "abc");
  EXPECT_EQ(bearer_token("Basic abc"), "");
  EXPECT_EQ(bearer_token("Bearer "), "");
  EXPECT_EQ(bearer_token(""), "");
}

TEST(AuthenticatorTest, SupabaseUserLookup) {
  test::FakeTransport http;
  http.reply(200, R"({"id":"user-42","email":"a@b.test"})");
  http.reply(401, R"({"msg":"invalid JWT"})");

  SupabaseAuthenticator auth(http, "https://proj.supabase.test/", "anon-key");
  const auto caller = auth.authenticate("jwt-1");
  ASSERT_TRUE(caller.has_value());
  EXPECT_EQ(caller->userId, "user-42");
  EXPECT_EQ(http.requests[0].url, "https://proj.supabase.test/auth/v1/user");
  EXPECT_EQ(http.requests[0].headers.at("Authorization"), "Bearer jwt-1");
  EXPECT_EQ(http.requests[0].headers.at("apikey"), "anon-key");

  EXPECT_FALSE(auth.authenticate("jwt-2").has_value());
  EXPECT_FALSE(auth.authenticate("").has_value());
  EXPECT_EQ(http.requests.size(), 2u);
}
