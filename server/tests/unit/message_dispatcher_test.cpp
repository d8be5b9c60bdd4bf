#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "gridworld/message_dispatcher.hpp"
#include "recording_connection.hpp"

namespace {

using gridworld::testing::RecordingConnection;

class MessageDispatcherTest : public ::testing::Test {
 protected:
  std::shared_ptr<RecordingConnection> Join() {
    auto conn = std::make_shared<RecordingConnection>();
    dispatcher_.HandleConnect(conn);
    return conn;
  }

  std::string IdOf(const RecordingConnection& conn) const { return *registry_.FindPlayerId(conn.Id()); }

  void Send(const std::shared_ptr<RecordingConnection>& conn, const nlohmann::json& message) {
    dispatcher_.HandleMessage(conn, message.dump());
  }

  nlohmann::json Move(const std::string& id, int x, int y) {
    return {{"type", "MOVE"}, {"playerId", id}, {"position", {{"x", x}, {"y", y}}}};
  }

  nlohmann::json Chat(const std::string& id, const std::string& content) {
    return {{"type", "CHAT"}, {"playerId", id}, {"content", content}};
  }

  nlohmann::json Tick() {
    world_.AdvanceTick();
    dispatcher_.BroadcastState();
    return observer_->MessagesOfType("STATE_UPDATE").back();
  }

  void AttachObserver() { observer_ = Join(); }

  gridworld::WorldState world_;
  std::shared_ptr<gridworld::Observability> observability_ =
      std::make_shared<gridworld::Observability>(gridworld::LogLevel::kError);
  gridworld::SessionRegistry registry_{world_, observability_};
  gridworld::MessageDispatcher dispatcher_{world_, registry_, observability_, 3};
  std::shared_ptr<RecordingConnection> observer_;
};

}  // namespace

TEST_F(MessageDispatcherTest, JoinSequenceSendsInitAndJoinedNotice) {
  auto a = Join();
  auto init_a = a->MessagesOfType("INIT");
  ASSERT_EQ(init_a.size(), 1u);
  auto id_a = IdOf(*a);
  EXPECT_EQ(init_a[0]["playerId"], id_a);
  EXPECT_TRUE(init_a[0]["gameState"]["players"].empty());

  auto b = Join();
  auto init_b = b->MessagesOfType("INIT");
  ASSERT_EQ(init_b.size(), 1u);
  auto id_b = IdOf(*b);
  EXPECT_EQ(init_b[0]["playerId"], id_b);
  EXPECT_TRUE(init_b[0]["gameState"]["players"].contains(id_a));
  EXPECT_FALSE(init_b[0]["gameState"]["players"].contains(id_b));

  auto joined = a->MessagesOfType("PLAYER_JOINED");
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(joined[0]["player"]["id"], id_b);
  EXPECT_TRUE(b->MessagesOfType("PLAYER_JOINED").empty());
}

TEST_F(MessageDispatcherTest, ValidMoveAppearsOnlyInNextSnapshot) {
  auto a = Join();
  AttachObserver();
  auto id = IdOf(*a);
  a->Clear();
  observer_->Clear();

  Send(a, Move(id, 5, 5));
  EXPECT_EQ(a->frame_count(), 0u);
  EXPECT_EQ(observer_->frame_count(), 0u);

  auto state = Tick();
  EXPECT_EQ(state["gameState"]["players"][id]["position"], (nlohmann::json{{"x", 5}, {"y", 5}}));
}

TEST_F(MessageDispatcherTest, OutOfBoundsMoveIsSilentlyIgnored) {
  auto a = Join();
  AttachObserver();
  auto id = IdOf(*a);
  Send(a, Move(id, 5, 5));
  a->Clear();

  Send(a, Move(id, 150, 5));
  EXPECT_TRUE(a->MessagesOfType("ERROR").empty());
  auto state = Tick();
  EXPECT_EQ(state["gameState"]["players"][id]["position"], (nlohmann::json{{"x", 5}, {"y", 5}}));
  EXPECT_EQ(observability_->Snapshot().validation_errors, 1u);
}

TEST_F(MessageDispatcherTest, MalformedEnvelopeGetsErrorAndConnectionStaysOpen) {
  auto a = Join();
  a->Clear();
  dispatcher_.HandleMessage(a, "{not json");
  auto errors = a->MessagesOfType("ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["message"], "Invalid message format");
  EXPECT_FALSE(a->closed());

  Send(a, Move(IdOf(*a), 1, 2));
  EXPECT_EQ(world_.FindPlayer(IdOf(*a))->position, (gridworld::Position{1, 2}));
}

TEST_F(MessageDispatcherTest, ImpersonationIsRejectedWithoutMutation) {
  auto a = Join();
  auto b = Join();
  auto id_b = IdOf(*b);
  a->Clear();
  b->Clear();

  Send(a, Move(id_b, 9, 9));
  auto errors = a->MessagesOfType("ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["message"], "Invalid player ID");
  EXPECT_EQ(b->frame_count(), 0u);
  EXPECT_EQ(world_.FindPlayer(id_b)->position, (gridworld::Position{0, 0}));
  EXPECT_EQ(observability_->Snapshot().identity_errors, 1u);
}

TEST_F(MessageDispatcherTest, StragglerAfterDisconnectIsRejected) {
  auto a = Join();
  auto id = IdOf(*a);
  dispatcher_.HandleDisconnect(a->Id());
  a->Clear();

  Send(a, Move(id, 3, 3));
  auto errors = a->MessagesOfType("ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["message"], "Invalid player ID");
  EXPECT_FALSE(world_.HasPlayer(id));
}

TEST_F(MessageDispatcherTest, ChatIsBroadcastToEveryoneIncludingSender) {
  auto a = Join();
  auto b = Join();
  a->Clear();
  b->Clear();

  Send(a, Chat(IdOf(*a), "  hello there!  "));
  for (const auto& conn : {a, b}) {
    auto chats = conn->MessagesOfType("CHAT_MESSAGE");
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0]["message"]["playerName"], "Player1");
    EXPECT_EQ(chats[0]["message"]["content"], "hello there!");
  }
}

TEST_F(MessageDispatcherTest, EmptyChatIsReportedToSenderOnly) {
  auto a = Join();
  auto b = Join();
  a->Clear();
  b->Clear();

  Send(a, Chat(IdOf(*a), "<<<>>>"));
  auto errors = a->MessagesOfType("ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["message"], "Empty chat message");
  EXPECT_EQ(b->frame_count(), 0u);
  EXPECT_TRUE(world_.Snapshot().chat_messages.empty());
}

TEST_F(MessageDispatcherTest, ChatOverflowKeepsLastHundred) {
  auto a = Join();
  AttachObserver();
  auto id = IdOf(*a);
  for (int i = 1; i <= 105; ++i) {
    Send(a, Chat(id, "m" + std::to_string(i)));
  }
  auto chat = Tick()["gameState"]["chatMessages"];
  ASSERT_EQ(chat.size(), 100u);
  for (std::size_t i = 0; i < chat.size(); ++i) {
    EXPECT_EQ(chat[i]["content"], "m" + std::to_string(i + 6));
  }
  EXPECT_EQ(a->MessagesOfType("CHAT_MESSAGE").size(), 105u);
}

TEST_F(MessageDispatcherTest, InteractValidatesIdentityButChangesNothing) {
  auto a = Join();
  auto id = IdOf(*a);
  auto before = world_.Snapshot();
  a->Clear();

  Send(a, {{"type", "INTERACT"}, {"playerId", id}, {"targetId", "tree-1"}});
  EXPECT_EQ(a->frame_count(), 0u);
  EXPECT_EQ(world_.FindPlayer(id)->position, before.players.at(id).position);

  Send(a, {{"type", "INTERACT"}, {"playerId", "someone-else"}, {"targetId", "tree-1"}});
  EXPECT_EQ(a->MessagesOfType("ERROR").size(), 1u);
}

TEST_F(MessageDispatcherTest, RunTogglesRunningFlag) {
  auto a = Join();
  auto id = IdOf(*a);
  Send(a, {{"type", "RUN"}, {"playerId", id}, {"isRunning", true}});
  EXPECT_TRUE(world_.FindPlayer(id)->is_running);
  Send(a, {{"type", "RUN"}, {"playerId", id}, {"isRunning", false}});
  EXPECT_FALSE(world_.FindPlayer(id)->is_running);
}

TEST_F(MessageDispatcherTest, DisconnectAnnouncesDepartureExactlyOnce) {
  auto a = Join();
  auto b = Join();
  auto id_a = IdOf(*a);
  b->Clear();

  dispatcher_.HandleDisconnect(a->Id());
  dispatcher_.HandleDisconnect(a->Id());

  auto left = b->MessagesOfType("PLAYER_LEFT");
  ASSERT_EQ(left.size(), 1u);
  EXPECT_EQ(left[0]["playerId"], id_a);

  world_.AdvanceTick();
  dispatcher_.BroadcastState();
  auto state = b->MessagesOfType("STATE_UPDATE").back();
  EXPECT_FALSE(state["gameState"]["players"].contains(id_a));
  EXPECT_TRUE(a->MessagesOfType("STATE_UPDATE").empty());
}

TEST_F(MessageDispatcherTest, TicksAreConsecutiveOnEachConnection) {
  AttachObserver();
  for (int i = 0; i < 5; ++i) {
    Tick();
  }
  auto updates = observer_->MessagesOfType("STATE_UPDATE");
  ASSERT_EQ(updates.size(), 5u);
  for (std::size_t i = 1; i < updates.size(); ++i) {
    EXPECT_EQ(updates[i]["gameState"]["tick"].get<std::uint64_t>(),
              updates[i - 1]["gameState"]["tick"].get<std::uint64_t>() + 1);
  }
}

TEST_F(MessageDispatcherTest, ServerFullClosesNewConnectionWithoutIdentity) {
  auto a = Join();
  auto b = Join();
  auto c = Join();
  auto d = std::make_shared<RecordingConnection>();

  EXPECT_FALSE(dispatcher_.HandleConnect(d));
  EXPECT_TRUE(d->closed());
  EXPECT_EQ(d->close_reason(), "Server full");
  EXPECT_EQ(d->frame_count(), 0u);
  EXPECT_FALSE(registry_.FindPlayerId(d->Id()).has_value());
  EXPECT_EQ(world_.PlayerCount(), 3u);
  EXPECT_TRUE(a->MessagesOfType("PLAYER_JOINED").size() == 2u);
}

TEST_F(MessageDispatcherTest, FailedRecipientDoesNotBlockStateBroadcast) {
  auto a = Join();
  auto b = Join();
  auto c = Join();
  b->RefuseDelivery();
  a->Clear();
  c->Clear();

  world_.AdvanceTick();
  dispatcher_.BroadcastState();
  EXPECT_EQ(a->MessagesOfType("STATE_UPDATE").size(), 1u);
  EXPECT_EQ(c->MessagesOfType("STATE_UPDATE").size(), 1u);
  EXPECT_EQ(observability_->Snapshot().delivery_errors, 1u);
}

TEST_F(MessageDispatcherTest, PlayerCountMatchesConnections) {
  auto a = Join();
  auto b = Join();
  EXPECT_EQ(registry_.Size(), world_.PlayerCount());
  dispatcher_.HandleDisconnect(b->Id());
  EXPECT_EQ(registry_.Size(), world_.PlayerCount());
  EXPECT_EQ(world_.PlayerCount(), 1u);
  EXPECT_TRUE(world_.HasPlayer(IdOf(*a)));
}
