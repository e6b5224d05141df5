#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "server/broadcast_hub.hpp"

#include <atomic>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::vector<std::string> types_of(const std::vector<std::string> &messages) {
  std::vector<std::string> types;
  for (const auto &message : messages) {
    types.push_back(json::parse(message)["type"].get<std::string>());
  }
  return types;
}

ProjectSummary summary(const std::string &id) {
  return {id, id + " site", "http://127.0.0.1:4000", "ready", 4000};
}

} // namespace

TEST(BroadcastHub, ProjectChannelsOnlySeeTheirProject) {
  BroadcastHub hub({});
  hub.open_project("p1");
  hub.open_project("p2");

  auto one = hub.subscribe("c1", std::string("p1"));
  auto two = hub.subscribe("c2", std::string("p2"));

  EXPECT_EQ(hub.publish("p1", FileChanged{"p1", "a.txt", ChangeKind::Modified}),
            1u);

  auto received = one->drain();
  ASSERT_EQ(received.size(), 1u);
  auto message = json::parse(received[0]);
  EXPECT_EQ(message["type"], "file-change");
  EXPECT_EQ(message["projectId"], "p1");
  EXPECT_TRUE(two->drain().empty());
}

TEST(BroadcastHub, GlobalChannelsOnlySeeCatalogueEvents) {
  BroadcastHub hub({});
  hub.open_project("p1");
  auto global = hub.subscribe("g1", std::nullopt);

  EXPECT_EQ(hub.publish("p1", RebuildComplete{"p1", RebuildCause::FileChange,
                                              std::chrono::milliseconds(5),
                                              {"a.txt"}}),
            0u);
  EXPECT_EQ(hub.publish_global(FileChanged{"p1", "a.txt", ChangeKind::Added}),
            0u);
  EXPECT_EQ(hub.publish_global(ProjectAdded{summary("p1")}), 1u);
  EXPECT_EQ(hub.publish_global(ProjectRemoved{"p1"}), 1u);

  EXPECT_EQ(types_of(global->drain()),
            (std::vector<std::string>{"project-added", "project-removed"}));
}

TEST(BroadcastHub, CatalogueEventsDoNotReachProjectChannels) {
  BroadcastHub hub({});
  hub.open_project("p1");
  auto project = hub.subscribe("c1", std::string("p1"));

  hub.publish_global(ProjectAdded{summary("p2")});
  EXPECT_TRUE(project->drain().empty());
}

TEST(BroadcastHub, FullMailboxDropsOldest) {
  BroadcastHub hub({3, 50});
  hub.open_project("p1");
  auto channel = hub.subscribe("c1", std::string("p1"));

  for (int i = 0; i < 5; ++i) {
    hub.publish("p1", FileChanged{"p1", "f" + std::to_string(i) + ".txt",
                                  ChangeKind::Modified});
  }

  EXPECT_EQ(channel->size(), 3u);
  EXPECT_EQ(channel->dropped(), 2u);

  auto messages = channel->drain();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(json::parse(messages[0])["change"]["relativePath"], "f2.txt");
  EXPECT_EQ(json::parse(messages[2])["change"]["relativePath"], "f4.txt");
}

TEST(BroadcastHub, SubscribingToUnknownProjectIsRefused) {
  BroadcastHub hub({});
  EXPECT_THROW(hub.subscribe("c1", std::string("ghost")), NotFoundError);
  EXPECT_EQ(hub.channel_count(), 0u);
}

TEST(BroadcastHub, ChannelLimitIsEnforced) {
  BroadcastHub hub({64, 2});
  hub.subscribe("c1", std::nullopt);
  hub.subscribe("c2", std::nullopt);

  try {
    hub.subscribe("c3", std::nullopt);
    FAIL() << "third channel accepted";
  } catch (const ResourceExhaustion &e) {
    EXPECT_TRUE(e.retryable());
  }
}

TEST(BroadcastHub, DuplicateChannelIdIsRefused) {
  BroadcastHub hub({});
  hub.subscribe("c1", std::nullopt);
  EXPECT_THROW(hub.subscribe("c1", std::nullopt), ConfigurationError);
}

TEST(BroadcastHub, ClosingAProjectSendsFarewellThenCloses) {
  BroadcastHub hub({});
  hub.open_project("p1");
  hub.open_project("p2");
  auto one = hub.subscribe("c1", std::string("p1"));
  auto two = hub.subscribe("c2", std::string("p2"));

  hub.close_project("p1");

  EXPECT_TRUE(one->closed());
  EXPECT_FALSE(two->closed());
  EXPECT_EQ(types_of(one->drain()),
            std::vector<std::string>{"project-removed"});
  EXPECT_FALSE(hub.project_open("p1"));
  EXPECT_EQ(hub.channel_count("p1"), 0u);
  EXPECT_EQ(hub.channel_count(), 1u);

  EXPECT_EQ(hub.publish("p1", FileChanged{"p1", "a.txt", ChangeKind::Added}),
            0u);
  EXPECT_THROW(hub.subscribe("c3", std::string("p1")), NotFoundError);
}

TEST(BroadcastHub, UnsubscribeFreesTheSlot) {
  BroadcastHub hub({64, 1});
  auto channel = hub.subscribe("c1", std::nullopt);
  hub.unsubscribe(channel);

  EXPECT_TRUE(channel->closed());
  EXPECT_EQ(hub.channel_count(), 0u);
  EXPECT_NO_THROW(hub.subscribe("c2", std::nullopt));
}

TEST(BroadcastHub, NotifierFiresOnPushAndClose) {
  BroadcastHub hub({});
  hub.open_project("p1");
  auto channel = hub.subscribe(hub.next_channel_id(), std::string("p1"));

  std::atomic<int> notified{0};
  channel->set_notifier([&]() { notified++; });
  int after_set = notified.load();

  hub.publish("p1", FileChanged{"p1", "a.txt", ChangeKind::Added});
  EXPECT_EQ(notified.load(), after_set + 1);

  hub.unsubscribe(channel);
  EXPECT_EQ(notified.load(), after_set + 2);
  EXPECT_FALSE(channel->push("late"));
}

TEST(BroadcastHub, ChannelIdsAreUnique) {
  BroadcastHub hub({});
  EXPECT_NE(hub.next_channel_id(), hub.next_channel_id());
}
