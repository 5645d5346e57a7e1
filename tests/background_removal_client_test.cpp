#include "services/replicate/BackgroundRemovalClient.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/errors/ServiceError.hpp"

using namespace wam;
using nlohmann::json;
using std::chrono::seconds;

namespace {

BackgroundRemovalSettings settings_for_test() {
  BackgroundRemovalSettings s;
  s.baseUrl = "https://api.test";
  s.apiToken = "r8_test";
  return s;
}

class ScriptedRemover : public BackgroundRemover {
public:
  explicit ScriptedRemover(int failures) : failures_(failures) {}

  std::string removeBackground(const std::string& url) override {
    ++calls;
    if (calls <= failures_) {
      throw UpstreamError(ErrorCode::BackgroundRemovalFailed, "model overloaded #" + std::to_string(calls));
    }
    return url + "?transparent";
  }

  int calls = 0;

private:
  int failures_;
};

} // namespace

TEST(BackgroundRemovalClientTest, ResolvesLatestVersionThenWaits) {
  test::FakeTransport http;
  http.reply(200, R"({"latest_version":{"id":"ver-9"}})");
  http.reply(201, R"({"id":"bg1","status":"succeeded","output":"https://cdn.test/clear.png"})");

  BackgroundRemovalClient client(http, settings_for_test());
  EXPECT_EQ(client.removeBackground("https://files.test/original.jpg"), "https://cdn.test/clear.png");

  ASSERT_EQ(http.requests.size(), 2u);
  EXPECT_EQ(http.requests[0].method, "GET");
  EXPECT_EQ(http.requests[0].url, "https://api.test/v1/models/851-labs/background-remover");
  EXPECT_EQ(http.requests[0].timeout, seconds(20));

  const auto& submit = http.requests[1];
  EXPECT_EQ(submit.url, "https://api.test/v1/predictions");
  EXPECT_EQ(submit.headers.at("Prefer"), "wait");
  EXPECT_EQ(submit.timeout, seconds(60));
  const auto body = json::parse(submit.body);
  EXPECT_EQ(body["version"], "ver-9");
  EXPECT_EQ(body["input"]["image"], "https://files.test/original.jpg");
}

TEST(BackgroundRemovalClientTest, VersionIsResolvedOnEveryCall) {
  test::FakeTransport http;
  for (int i = 0; i < 2; ++i) {
    http.reply(200, R"({"latest_version":{"id":"ver-)" + std::to_string(i) + R"("}})");
    http.reply(201, R"({"status":"succeeded","output":"https://cdn.test/x.png"})");
  }

  BackgroundRemovalClient client(http, settings_for_test());
  client.removeBackground("https://files.test/a.jpg");
  client.removeBackground("https://files.test/b.jpg");

  ASSERT_EQ(http.requests.size(), 4u);
  EXPECT_EQ(json::parse(http.requests[1].body)["version"], "ver-0");
  EXPECT_EQ(json::parse(http.requests[3].body)["version"], "ver-1");
}

TEST(BackgroundRemovalClientTest, PinnedVersionSkipsRegistry) {
  test::FakeTransport http;
  http.reply(201, R"({"status":"succeeded","output":["https://cdn.test/y.png"]})");

  auto s = settings_for_test();
  s.model = "851-labs/background-remover:pinned-1";
  BackgroundRemovalClient client(http, s);
  EXPECT_EQ(client.removeBackground("https://files.test/a.jpg"), "https://cdn.test/y.png");
  ASSERT_EQ(http.requests.size(), 1u);
  EXPECT_EQ(json::parse(http.requests[0].body)["version"], "pinned-1");
}

TEST(BackgroundRemovalClientTest, FailedStatusSurfacesServiceError) {
  test::FakeTransport http;
  http.reply(201, R"({"status":"failed","error":"model overloaded"})");

  auto s = settings_for_test();
  s.pinnedVersion = "v";
  BackgroundRemovalClient client(http, s);
  try {
    client.removeBackground("https://files.test/a.jpg");
    FAIL() << "expected UpstreamError";
  } catch (const UpstreamError& e) {
    EXPECT_EQ(e.code(), ErrorCode::BackgroundRemovalFailed);
    EXPECT_NE(std::string(e.what()).find("model overloaded"), std::string::npos);
  }
}

TEST(BackgroundRemovalClientTest, NonTerminalStatusIsUnexpected) {
  test::FakeTransport http;
  http.reply(201, R"({"status":"processing"})");

  auto s = settings_for_test();
  s.pinnedVersion = "v";
  BackgroundRemovalClient client(http, s);
  try {
    client.removeBackground("https://files.test/a.jpg");
    FAIL() << "expected UpstreamError";
  } catch (const UpstreamError& e) {
    EXPECT_NE(std::string(e.what()).find("unexpected"), std::string::npos);
  }
}

TEST(BackgroundRemovalClientTest, RegistryWithoutVersionFails) {
  test::FakeTransport http;
  http.reply(200, R"({"name":"background-remover"})");

  BackgroundRemovalClient client(http, settings_for_test());
  EXPECT_THROW(client.removeBackground("https://files.test/a.jpg"), UpstreamError);
  EXPECT_EQ(http.requests.size(), 1u);
}

TEST(RetryingBackgroundRemoverTest, RecoversWithLinearBackoff) {
  ScriptedRemover inner(2);
  test::FakeClock clock;
  RetryingBackgroundRemover remover(inner, 3, clock.timing());

  EXPECT_EQ(remover.removeBackground("u"), "u?transparent");
  EXPECT_EQ(inner.calls, 3);
  ASSERT_EQ(clock.sleeps.size(), 2u);
  EXPECT_EQ(clock.sleeps[0], seconds(1));
  EXPECT_EQ(clock.sleeps[1], seconds(2));
}

TEST(RetryingBackgroundRemoverTest, PropagatesLastErrorAfterThreeFailures) {
  ScriptedRemover inner(10);
  test::FakeClock clock;
  RetryingBackgroundRemover remover(inner, 3, clock.timing());

  try {
    remover.removeBackground("u");
    FAIL() << "expected UpstreamError";
  } catch (const UpstreamError& e) {
    EXPECT_STREQ(e.what(), "model overloaded #3");
  }
  EXPECT_EQ(inner.calls, 3);
  EXPECT_EQ(clock.sleeps.size(), 2u);
}
