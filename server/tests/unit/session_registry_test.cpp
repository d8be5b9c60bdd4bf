#include <memory>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "gridworld/session_registry.hpp"
#include "recording_connection.hpp"

namespace {

using gridworld::testing::RecordingConnection;

class SessionRegistryTest : public ::testing::Test {
 protected:
  gridworld::WorldState world_;
  std::shared_ptr<gridworld::Observability> observability_ =
      std::make_shared<gridworld::Observability>(gridworld::LogLevel::kError);
  gridworld::SessionRegistry registry_{world_, observability_};
};

}  // namespace

TEST_F(SessionRegistryTest, ConnectSeedsDefaultPlayer) {
  auto conn = std::make_shared<RecordingConnection>();
  auto id = registry_.OnConnect(conn);
  EXPECT_FALSE(id.empty());
  auto player = world_.FindPlayer(id);
  ASSERT_TRUE(player.has_value());
  EXPECT_EQ(player->name, "Player1");
  EXPECT_EQ(player->skills.at("hitpoints"), 10);
  EXPECT_EQ(registry_.FindPlayerId(conn->Id()), id);
  EXPECT_EQ(registry_.Size(), 1u);
  EXPECT_EQ(observability_->Snapshot().players_online, 1u);
}

TEST_F(SessionRegistryTest, EachConnectionGetsDistinctIdentity) {
  auto a = std::make_shared<RecordingConnection>();
  auto b = std::make_shared<RecordingConnection>();
  auto id_a = registry_.OnConnect(a);
  auto id_b = registry_.OnConnect(b);
  EXPECT_NE(id_a, id_b);
  EXPECT_EQ(world_.FindPlayer(id_b)->name, "Player2");
  EXPECT_EQ(registry_.Size(), world_.PlayerCount());
}

TEST_F(SessionRegistryTest, ReconnectingSameConnectionKeepsIdentity) {
  auto conn = std::make_shared<RecordingConnection>();
  auto first = registry_.OnConnect(conn);
  auto second = registry_.OnConnect(conn);
  EXPECT_EQ(first, second);
  EXPECT_EQ(world_.PlayerCount(), 1u);
}

TEST_F(SessionRegistryTest, DisconnectIsIdempotent) {
  auto conn = std::make_shared<RecordingConnection>();
  auto id = registry_.OnConnect(conn);
  auto removed = registry_.OnDisconnect(conn->Id());
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, id);
  EXPECT_FALSE(world_.HasPlayer(id));
  EXPECT_FALSE(registry_.OnDisconnect(conn->Id()).has_value());
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(SessionRegistryTest, UnknownConnectionDisconnectIsNoop) {
  EXPECT_FALSE(registry_.OnDisconnect(987654321).has_value());
}

TEST_F(SessionRegistryTest, IdentitiesAreNeverReused) {
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    auto conn = std::make_shared<RecordingConnection>();
    auto id = registry_.OnConnect(conn);
    EXPECT_TRUE(seen.insert(id).second) << id;
    ASSERT_TRUE(registry_.OnDisconnect(conn->Id()).has_value());
  }
  EXPECT_EQ(world_.PlayerCount(), 0u);
}

TEST_F(SessionRegistryTest, BroadcastHonoursExclusion) {
  auto a = std::make_shared<RecordingConnection>();
  auto b = std::make_shared<RecordingConnection>();
  registry_.OnConnect(a);
  registry_.OnConnect(b);
  auto delivered = registry_.Broadcast(gridworld::MakeFrame("{}"), a->Id());
  EXPECT_EQ(delivered, 1u);
  EXPECT_EQ(a->frame_count(), 0u);
  EXPECT_EQ(b->frame_count(), 1u);
}

TEST_F(SessionRegistryTest, FailedRecipientDoesNotStopBroadcast) {
  auto a = std::make_shared<RecordingConnection>();
  auto b = std::make_shared<RecordingConnection>();
  auto c = std::make_shared<RecordingConnection>();
  registry_.OnConnect(a);
  registry_.OnConnect(b);
  registry_.OnConnect(c);
  b->RefuseDelivery();

  auto delivered = registry_.Broadcast(gridworld::MakeFrame("{}"));
  EXPECT_EQ(delivered, 2u);
  EXPECT_EQ(a->frame_count(), 1u);
  EXPECT_EQ(c->frame_count(), 1u);
  EXPECT_EQ(observability_->Snapshot().delivery_errors, 1u);
}

TEST_F(SessionRegistryTest, ExpiredConnectionCountsAsDeliveryFailure) {
  auto a = std::make_shared<RecordingConnection>();
  auto b = std::make_shared<RecordingConnection>();
  registry_.OnConnect(a);
  registry_.OnConnect(b);
  b.reset();

  EXPECT_EQ(registry_.Broadcast(gridworld::MakeFrame("{}")), 1u);
  EXPECT_EQ(a->frame_count(), 1u);
  EXPECT_EQ(observability_->Snapshot().delivery_errors, 1u);
}

TEST_F(SessionRegistryTest, SendToUnknownConnectionFails) {
  EXPECT_FALSE(registry_.SendTo(424242, gridworld::MakeFrame("{}")));
}
