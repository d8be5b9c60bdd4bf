/*
 * 설명: 클라이언트/서버 간 JSON 엔벨로프의 인코딩과 디코딩, HTTP 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "gridworld/world_state.hpp"

namespace gridworld {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

enum class ClientMessageType { kMove, kChat, kInteract, kRun };

struct ClientMessage {
  ClientMessageType type{ClientMessageType::kMove};
  std::string player_id;
  Position position;
  std::string content;
  std::string target_id;
  bool is_running{false};
};

enum class ServerMessageType { kInit, kStateUpdate, kPlayerJoined, kPlayerLeft, kChatMessage, kError };

struct ServerMessage {
  ServerMessageType type{ServerMessageType::kError};
  std::string player_id;
  GameState game_state;
  Player player;
  ChatMessage chat;
  std::string error;
};

std::string_view ToString(ClientMessageType type);
std::string_view ToString(ServerMessageType type);

nlohmann::json ToJson(const Position& position);
nlohmann::json ToJson(const Item& item);
nlohmann::json ToJson(const Player& player);
nlohmann::json ToJson(const ChatMessage& message);
nlohmann::json ToJson(const WorldObject& object);
nlohmann::json ToJson(const GameState& state);

// nlohmann::json::exception을 그대로 전파한다.
Position PositionFromJson(const nlohmann::json& j);
Player PlayerFromJson(const nlohmann::json& j);
ChatMessage ChatMessageFromJson(const nlohmann::json& j);
GameState GameStateFromJson(const nlohmann::json& j);

std::string EncodeInit(const std::string& player_id, const GameState& state);
std::string EncodeStateUpdate(const GameState& state);
std::string EncodePlayerJoined(const Player& player);
std::string EncodePlayerLeft(const std::string& player_id);
std::string EncodeChatMessage(const ChatMessage& message);
std::string EncodeError(std::string_view message);

std::optional<ClientMessage> DecodeClientMessage(std::string_view raw, std::string& error);
std::string EncodeClientMessage(const ClientMessage& message);

std::optional<ServerMessage> DecodeServerMessage(std::string_view raw, std::string& error);

}  // namespace gridworld
