/*
 * 설명: 클라이언트 메시지를 검증해 월드 상태에 반영하고 입장/퇴장/채팅/상태 메시지를 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/message_dispatcher.hpp"

#include <utility>

namespace gridworld {

MessageDispatcher::MessageDispatcher(WorldState& world, SessionRegistry& registry,
                                     std::shared_ptr<Observability> observability, std::size_t max_players)
    : world_(world), registry_(registry), observability_(std::move(observability)), max_players_(max_players) {}

bool MessageDispatcher::HandleConnect(const std::shared_ptr<Connection>& connection) {
  if (registry_.FindPlayerId(connection->Id())) {
    return true;
  }
  if (registry_.Size() >= max_players_) {
    observability_->Log(LogContext{LogLevel::kWarn, "server_full", std::nullopt, connection->Id(), {}});
    connection->Close("Server full");
    return false;
  }

  // INIT에는 입장 직전의 월드를 담는다.
  auto before_join = world_.Snapshot();
  auto player_id = registry_.OnConnect(connection);
  auto player = world_.FindPlayer(player_id);

  registry_.SendTo(connection->Id(), MakeFrame(EncodeInit(player_id, before_join)));
  if (player) {
    registry_.Broadcast(MakeFrame(EncodePlayerJoined(*player)), connection->Id());
  }
  observability_->Log(LogContext{LogLevel::kInfo, "player_joined", player_id, connection->Id(), {}});
  return true;
}

void MessageDispatcher::HandleMessage(const std::shared_ptr<Connection>& connection, std::string_view raw) {
  observability_->IncrementMessages();

  std::string error_message;
  auto message = DecodeClientMessage(raw, error_message);
  if (!message) {
    return Reject(connection, ErrorKind::kDecode, error_message, error_message);
  }
  if (!Authenticate(*connection, *message, error_message)) {
    return Reject(connection, ErrorKind::kIdentity, error_message,
                  std::string(ToString(message->type)) + " claimed " + message->player_id);
  }

  switch (message->type) {
    case ClientMessageType::kMove:
      HandleMove(*connection, *message);
      break;
    case ClientMessageType::kChat:
      HandleChat(connection, *message);
      break;
    case ClientMessageType::kInteract:
      HandleInteract(*connection, *message);
      break;
    case ClientMessageType::kRun:
      HandleRun(*connection, *message);
      break;
  }
}

void MessageDispatcher::HandleDisconnect(std::uint64_t connection_id) {
  auto player_id = registry_.OnDisconnect(connection_id);
  if (!player_id) {
    return;
  }
  registry_.Broadcast(MakeFrame(EncodePlayerLeft(*player_id)));
  observability_->Log(LogContext{LogLevel::kInfo, "player_left", *player_id, connection_id, {}});
}

void MessageDispatcher::BroadcastState() {
  // 스냅샷은 한 번만 직렬화해 모든 세션이 같은 프레임을 공유한다.
  registry_.Broadcast(MakeFrame(EncodeStateUpdate(world_.Snapshot())));
}

bool MessageDispatcher::Authenticate(const Connection& connection, const ClientMessage& message,
                                     std::string& error_message) const {
  auto session_player = registry_.FindPlayerId(connection.Id());
  if (!session_player || *session_player != message.player_id) {
    error_message = "Invalid player ID";
    return false;
  }
  if (!world_.HasPlayer(message.player_id)) {
    error_message = "Player not found";
    return false;
  }
  return true;
}

void MessageDispatcher::HandleMove(const Connection& connection, const ClientMessage& message) {
  if (!world_.ApplyMove(message.player_id, message.position)) {
    // 범위 밖 이동은 클라이언트에 알리지 않고 버린다.
    observability_->IncrementError(ErrorKind::kValidation);
    observability_->Log(LogContext{LogLevel::kDebug, "move_rejected", message.player_id, connection.Id(),
                                   "(" + std::to_string(message.position.x) + "," +
                                       std::to_string(message.position.y) + ")"});
  }
}

void MessageDispatcher::HandleChat(const std::shared_ptr<Connection>& connection, const ClientMessage& message) {
  auto player = world_.FindPlayer(message.player_id);
  if (!player) {
    return Reject(connection, ErrorKind::kIdentity, "Player not found", message.player_id);
  }
  auto chat = world_.AppendChat(player->name, message.content);
  if (!chat) {
    return Reject(connection, ErrorKind::kValidation, "Empty chat message", message.player_id);
  }
  registry_.Broadcast(MakeFrame(EncodeChatMessage(*chat)));
}

void MessageDispatcher::HandleInteract(const Connection& connection, const ClientMessage& message) {
  observability_->Log(LogContext{LogLevel::kDebug, "interact", message.player_id, connection.Id(),
                                 message.target_id});
}

void MessageDispatcher::HandleRun(const Connection& connection, const ClientMessage& message) {
  if (!world_.SetRunning(message.player_id, message.is_running)) {
    observability_->IncrementError(ErrorKind::kValidation);
    observability_->Log(LogContext{LogLevel::kDebug, "run_rejected", message.player_id, connection.Id(),
                                   "no run energy"});
  }
}

void MessageDispatcher::Reject(const std::shared_ptr<Connection>& connection, ErrorKind kind,
                               std::string_view message, const std::string& detail) {
  observability_->IncrementError(kind);
  observability_->Log(LogContext{LogLevel::kWarn, std::string(ToString(kind)) + "_error",
                                 registry_.FindPlayerId(connection->Id()), connection->Id(), detail});
  if (!connection->Send(MakeFrame(EncodeError(message)))) {
    observability_->IncrementError(ErrorKind::kDelivery);
  }
}

}  // namespace gridworld
