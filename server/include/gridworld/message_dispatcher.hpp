/*
 * 설명: 수신 엔벨로프를 디코딩하고 신원을 검증한 뒤 월드 상태에 반영하며 송신 메시지를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "gridworld/connection.hpp"
#include "gridworld/observability.hpp"
#include "gridworld/protocol.hpp"
#include "gridworld/session_registry.hpp"
#include "gridworld/world_state.hpp"

namespace gridworld {

class MessageDispatcher {
 public:
  MessageDispatcher(WorldState& world, SessionRegistry& registry, std::shared_ptr<Observability> observability,
                    std::size_t max_players);

  // 정원이 찼으면 연결을 닫고 false를 반환한다.
  bool HandleConnect(const std::shared_ptr<Connection>& connection);
  void HandleMessage(const std::shared_ptr<Connection>& connection, std::string_view raw);
  void HandleDisconnect(std::uint64_t connection_id);
  void BroadcastState();

 private:
  bool Authenticate(const Connection& connection, const ClientMessage& message, std::string& error_message) const;
  void HandleMove(const Connection& connection, const ClientMessage& message);
  void HandleChat(const std::shared_ptr<Connection>& connection, const ClientMessage& message);
  void HandleInteract(const Connection& connection, const ClientMessage& message);
  void HandleRun(const Connection& connection, const ClientMessage& message);
  void Reject(const std::shared_ptr<Connection>& connection, ErrorKind kind, std::string_view message,
              const std::string& detail);

  WorldState& world_;
  SessionRegistry& registry_;
  std::shared_ptr<Observability> observability_;
  std::size_t max_players_;
};

}  // namespace gridworld
