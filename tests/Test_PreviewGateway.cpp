#include <gtest/gtest.h>

#include "TestSupport.h"
#include "core/errors.hpp"
#include "server/preview_gateway.hpp"

#include <nlohmann/json.hpp>

using namespace test_support;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

PreviewConfig gateway_config() {
  PreviewConfig config;
  config.debounce_window = 100ms;
  config.settle_window = 30ms;
  config.quiet = true;
  return config;
}

Project make_project(const fs::path &root, const std::string &id) {
  Project project;
  project.id = id;
  project.root = root;
  return project;
}

std::optional<json> next_of_type(WsClient &client, const std::string &type) {
  while (auto message = client.read()) {
    json parsed = json::parse(*message);
    if (parsed["type"] == type) {
      return parsed;
    }
  }
  return std::nullopt;
}

class PreviewGatewayTest : public ::testing::Test {
protected:
  void SetUp() override {
    write_file(dir / "index.html", "<html><head></head><body>hi</body></html>");
    registry = std::make_unique<PreviewRegistry>(config, policy);
    gateway = std::make_unique<PreviewGateway>(
        *registry, PreviewGateway::Options{"127.0.0.1", 0});
    port = gateway->start();
  }

  void TearDown() override {
    registry->shutdown();
    gateway->stop();
  }

  TempDir dir;
  AllowAllPolicy policy;
  PreviewConfig config = gateway_config();
  std::unique_ptr<PreviewRegistry> registry;
  std::unique_ptr<PreviewGateway> gateway;
  int port = 0;
};

} // namespace

TEST_F(PreviewGatewayTest, BindsAnEphemeralPort) {
  EXPECT_GT(port, 0);
  EXPECT_EQ(gateway->ws_url(), "ws://127.0.0.1:" + std::to_string(port) + "/");
  EXPECT_EQ(gateway->start(), port);
}

TEST_F(PreviewGatewayTest, TakenPortIsAStartupError) {
  PreviewGateway second(*registry, PreviewGateway::Options{"127.0.0.1", port});
  EXPECT_THROW(second.start(), StartupError);

  try {
    second.start();
    FAIL() << "second gateway bound a port already in use";
  } catch (const ServeError &) {
    FAIL() << "bind failure reported as a serving error";
  } catch (const StartupError &e) {
    EXPECT_NE(std::string(e.what()).find(std::to_string(port)),
              std::string::npos);
  }

  EXPECT_EQ(gateway->ws_url(), "ws://127.0.0.1:" + std::to_string(port) + "/");
  EXPECT_EQ(http_get(port, "/projects").status, 200);
}

TEST_F(PreviewGatewayTest, ProjectChannelGetsStateThenEvents) {
  registry->register_project(make_project(dir.path(), "p1"));

  WsClient client;
  ASSERT_EQ(client.connect(port, "/?project=p1"), 101);

  auto greeting = client.read();
  ASSERT_TRUE(greeting.has_value());
  json state = json::parse(*greeting);
  EXPECT_EQ(state["type"], "project-state");
  EXPECT_EQ(state["project"]["id"], "p1");
  EXPECT_EQ(state["project"]["status"], "ready");

  registry->rebuild("p1");
  auto complete = next_of_type(client, "rebuild-complete");
  ASSERT_TRUE(complete.has_value());
  EXPECT_EQ((*complete)["projectId"], "p1");
  EXPECT_EQ((*complete)["trigger"], "manual");
}

TEST_F(PreviewGatewayTest, FileChangesReachTheBrowser) {
  registry->register_project(make_project(dir.path(), "p1"));

  WsClient client;
  ASSERT_EQ(client.connect(port, "/?project=p1"), 101);
  ASSERT_TRUE(client.read().has_value());

  write_file(dir / "style.css", "body {}");
  auto complete = next_of_type(client, "rebuild-complete");
  ASSERT_TRUE(complete.has_value());
  EXPECT_EQ((*complete)["files"], json::array({"style.css"}));
}

TEST_F(PreviewGatewayTest, CatalogueChannelGetsProjectsList) {
  registry->register_project(make_project(dir.path(), "p1"));

  WsClient client;
  ASSERT_EQ(client.connect(port, "/"), 101);

  auto greeting = client.read();
  ASSERT_TRUE(greeting.has_value());
  json list = json::parse(*greeting);
  EXPECT_EQ(list["type"], "projects-list");
  ASSERT_EQ(list["projects"].size(), 1u);
  EXPECT_EQ(list["projects"][0]["id"], "p1");

  TempDir other;
  registry->register_project(make_project(other.path(), "p2"));
  auto added = next_of_type(client, "project-added");
  ASSERT_TRUE(added.has_value());
  EXPECT_EQ((*added)["project"]["id"], "p2");
}

TEST_F(PreviewGatewayTest, UnknownProjectIsRefused) {
  WsClient client;
  EXPECT_EQ(client.connect(port, "/?project=ghost"), 404);
  EXPECT_EQ(gateway->session_count(), 0u);
}

TEST_F(PreviewGatewayTest, UnregisterSaysGoodbyeAndCloses) {
  registry->register_project(make_project(dir.path(), "p1"));

  WsClient client;
  ASSERT_EQ(client.connect(port, "/?project=p1"), 101);
  ASSERT_TRUE(client.read().has_value());
  ASSERT_TRUE(wait_until([&]() { return gateway->session_count() == 1; }));

  registry->unregister_project("p1");

  auto farewell = client.read();
  ASSERT_TRUE(farewell.has_value());
  EXPECT_EQ(json::parse(*farewell)["type"], "project-removed");
  EXPECT_FALSE(client.read().has_value());
  EXPECT_TRUE(client.closed());
  EXPECT_TRUE(wait_until([&]() { return gateway->session_count() == 0; }));
}

TEST_F(PreviewGatewayTest, ChannelLimitAnswersServiceUnavailable) {
  gateway.reset();
  registry.reset();

  config.max_channels = 1;
  registry = std::make_unique<PreviewRegistry>(config, policy);
  gateway = std::make_unique<PreviewGateway>(
      *registry, PreviewGateway::Options{"127.0.0.1", 0});
  port = gateway->start();

  WsClient first;
  ASSERT_EQ(first.connect(port, "/"), 101);
  ASSERT_TRUE(first.read().has_value());

  WsClient second;
  EXPECT_EQ(second.connect(port, "/"), 503);
}

TEST_F(PreviewGatewayTest, ControlApiListsProjects) {
  auto empty = http_get(port, "/projects");
  EXPECT_EQ(empty.status, 200);
  EXPECT_EQ(json::parse(empty.body), json::array());

  registry->register_project(make_project(dir.path(), "p1"));
  auto listed = http_get(port, "/projects");
  json projects = json::parse(listed.body);
  ASSERT_EQ(projects.size(), 1u);
  EXPECT_EQ(projects[0]["id"], "p1");

  auto one = http_get(port, "/projects/p1");
  EXPECT_EQ(one.status, 200);
  EXPECT_EQ(json::parse(one.body)["status"], "ready");

  EXPECT_EQ(http_get(port, "/projects/ghost").status, 404);
  EXPECT_EQ(http_get(port, "/elsewhere").status, 404);
}

TEST_F(PreviewGatewayTest, ControlApiRegistersProjects) {
  json descriptor = {{"id", "shop"}, {"rootPath", dir.path().string()}};
  auto created = http_request(port, "POST", "/projects", descriptor.dump(),
                              "application/json");
  ASSERT_EQ(created.status, 201);

  json body = json::parse(created.body);
  EXPECT_EQ(body["id"], "shop");
  std::string preview_url = body["previewUrl"];
  EXPECT_EQ(preview_url.rfind("http://127.0.0.1:", 0), 0u);

  auto session = registry->get("shop");
  ASSERT_TRUE(session.has_value());
  auto page = http_get(session->port, "/");
  EXPECT_EQ(page.status, 200);
  EXPECT_NE(page.body.find(ProjectServer::kLivereloadPath), std::string::npos);

  auto script = http_get(session->port, ProjectServer::kLivereloadPath);
  EXPECT_NE(script.body.find(gateway->ws_url() + "?project=shop"),
            std::string::npos);
}

TEST_F(PreviewGatewayTest, ControlApiRejectsBadDescriptors) {
  auto garbage = http_request(port, "POST", "/projects", "{not json",
                              "application/json");
  EXPECT_EQ(garbage.status, 400);
  EXPECT_TRUE(json::parse(garbage.body).contains("error"));

  json missing_root = {{"id", "p1"}, {"rootPath", (dir / "nope").string()}};
  EXPECT_EQ(http_request(port, "POST", "/projects", missing_root.dump(),
                         "application/json")
                .status,
            400);
  EXPECT_TRUE(registry->list().empty());

  EXPECT_EQ(http_request(port, "PUT", "/projects").status, 405);
}

TEST_F(PreviewGatewayTest, ControlApiRemovesProjects) {
  registry->register_project(make_project(dir.path(), "p1"));

  auto removed = http_request(port, "DELETE", "/projects/p1");
  EXPECT_EQ(removed.status, 204);
  EXPECT_TRUE(removed.body.empty());
  EXPECT_FALSE(registry->get("p1").has_value());

  EXPECT_EQ(http_request(port, "DELETE", "/projects/p1").status, 404);
}

TEST_F(PreviewGatewayTest, ControlApiTriggersRebuilds) {
  registry->register_project(make_project(dir.path(), "p1"));
  auto channel = registry->hub().subscribe("c1", std::string("p1"));

  auto queued = http_request(port, "POST", "/projects/p1/rebuild");
  EXPECT_EQ(queued.status, 202);
  EXPECT_EQ(json::parse(queued.body)["queued"], true);

  EXPECT_TRUE(wait_until([&]() {
    for (const auto &message : channel->drain()) {
      if (json::parse(message)["type"] == "rebuild-complete") {
        return true;
      }
    }
    return false;
  }));

  EXPECT_EQ(http_request(port, "POST", "/projects/ghost/rebuild").status, 404);
  EXPECT_EQ(http_get(port, "/projects/p1/rebuild").status, 405);
}
