/*
 * 설명: 게임 프로토콜 엔벨로프와 HTTP 응답 엔벨로프를 JSON으로 직렬화/역직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "gridworld/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace gridworld {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

bool ReadInt(const nlohmann::json& value, int& out) {
  if (value.is_number_unsigned()) {
    auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  if (value.is_number_integer()) {
    auto v = value.get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  return false;
}

bool ReadString(const nlohmann::json& message, const char* key, std::string& out) {
  auto it = message.find(key);
  if (it == message.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

Item ItemFromJson(const nlohmann::json& j) {
  Item item;
  item.id = j.at("id").get<std::string>();
  item.name = j.at("name").get<std::string>();
  item.stackable = j.at("stackable").get<bool>();
  item.quantity = j.at("quantity").get<int>();
  return item;
}

WorldObject WorldObjectFromJson(const nlohmann::json& j) {
  WorldObject object;
  object.id = j.at("id").get<std::string>();
  object.type = j.at("type").get<std::string>();
  object.position = PositionFromJson(j.at("position"));
  return object;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

std::string_view ToString(ClientMessageType type) {
  switch (type) {
    case ClientMessageType::kMove:
      return "MOVE";
    case ClientMessageType::kChat:
      return "CHAT";
    case ClientMessageType::kInteract:
      return "INTERACT";
    case ClientMessageType::kRun:
      return "RUN";
  }
  return "UNKNOWN";
}

std::string_view ToString(ServerMessageType type) {
  switch (type) {
    case ServerMessageType::kInit:
      return "INIT";
    case ServerMessageType::kStateUpdate:
      return "STATE_UPDATE";
    case ServerMessageType::kPlayerJoined:
      return "PLAYER_JOINED";
    case ServerMessageType::kPlayerLeft:
      return "PLAYER_LEFT";
    case ServerMessageType::kChatMessage:
      return "CHAT_MESSAGE";
    case ServerMessageType::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

nlohmann::json ToJson(const Position& position) { return {{"x", position.x}, {"y", position.y}}; }

nlohmann::json ToJson(const Item& item) {
  return {{"id", item.id}, {"name", item.name}, {"stackable", item.stackable}, {"quantity", item.quantity}};
}

nlohmann::json ToJson(const Player& player) {
  nlohmann::json inventory = nlohmann::json::array();
  for (const auto& item : player.inventory) {
    inventory.push_back(ToJson(item));
  }
  nlohmann::json skills = nlohmann::json::object();
  for (const auto& [name, level] : player.skills) {
    skills[name] = level;
  }
  return {{"id", player.id},
          {"name", player.name},
          {"position", ToJson(player.position)},
          {"isRunning", player.is_running},
          {"runEnergy", player.run_energy},
          {"inventory", inventory},
          {"skills", skills}};
}

nlohmann::json ToJson(const ChatMessage& message) {
  return {{"playerName", message.player_name}, {"content", message.content}, {"timestamp", message.timestamp}};
}

nlohmann::json ToJson(const WorldObject& object) {
  return {{"id", object.id}, {"type", object.type}, {"position", ToJson(object.position)}};
}

nlohmann::json ToJson(const GameState& state) {
  nlohmann::json players = nlohmann::json::object();
  for (const auto& [id, player] : state.players) {
    players[id] = ToJson(player);
  }
  nlohmann::json chat = nlohmann::json::array();
  for (const auto& message : state.chat_messages) {
    chat.push_back(ToJson(message));
  }
  nlohmann::json objects = nlohmann::json::object();
  for (const auto& [id, object] : state.world_objects) {
    objects[id] = ToJson(object);
  }
  return {{"tick", state.tick}, {"players", players}, {"chatMessages", chat}, {"worldObjects", objects}};
}

Position PositionFromJson(const nlohmann::json& j) { return Position{j.at("x").get<int>(), j.at("y").get<int>()}; }

Player PlayerFromJson(const nlohmann::json& j) {
  Player player;
  player.id = j.at("id").get<std::string>();
  player.name = j.at("name").get<std::string>();
  player.position = PositionFromJson(j.at("position"));
  player.is_running = j.at("isRunning").get<bool>();
  player.run_energy = j.at("runEnergy").get<double>();
  for (const auto& item : j.at("inventory")) {
    player.inventory.push_back(ItemFromJson(item));
  }
  for (const auto& [name, level] : j.at("skills").items()) {
    player.skills[name] = level.get<int>();
  }
  return player;
}

ChatMessage ChatMessageFromJson(const nlohmann::json& j) {
  return ChatMessage{j.at("playerName").get<std::string>(), j.at("content").get<std::string>(),
                     j.at("timestamp").get<std::int64_t>()};
}

GameState GameStateFromJson(const nlohmann::json& j) {
  GameState state;
  state.tick = j.at("tick").get<std::uint64_t>();
  for (const auto& [id, player] : j.at("players").items()) {
    state.players[id] = PlayerFromJson(player);
  }
  for (const auto& message : j.at("chatMessages")) {
    state.chat_messages.push_back(ChatMessageFromJson(message));
  }
  for (const auto& [id, object] : j.at("worldObjects").items()) {
    state.world_objects[id] = WorldObjectFromJson(object);
  }
  return state;
}

std::string EncodeInit(const std::string& player_id, const GameState& state) {
  return nlohmann::json{{"type", "INIT"}, {"playerId", player_id}, {"gameState", ToJson(state)}}.dump();
}

std::string EncodeStateUpdate(const GameState& state) {
  return nlohmann::json{{"type", "STATE_UPDATE"}, {"gameState", ToJson(state)}}.dump();
}

std::string EncodePlayerJoined(const Player& player) {
  return nlohmann::json{{"type", "PLAYER_JOINED"}, {"player", ToJson(player)}}.dump();
}

std::string EncodePlayerLeft(const std::string& player_id) {
  return nlohmann::json{{"type", "PLAYER_LEFT"}, {"playerId", player_id}}.dump();
}

std::string EncodeChatMessage(const ChatMessage& message) {
  return nlohmann::json{{"type", "CHAT_MESSAGE"}, {"message", ToJson(message)}}.dump();
}

std::string EncodeError(std::string_view message) {
  return nlohmann::json{{"type", "ERROR"}, {"message", message}}.dump();
}

std::optional<ClientMessage> DecodeClientMessage(std::string_view raw, std::string& error) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::exception&) {
    error = "Invalid message format";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error = "Invalid message format";
    return std::nullopt;
  }

  std::string type;
  if (!ReadString(message, "type", type)) {
    error = "Missing message type";
    return std::nullopt;
  }
  ClientMessage decoded;
  if (!ReadString(message, "playerId", decoded.player_id)) {
    error = "Missing playerId";
    return std::nullopt;
  }

  if (type == "MOVE") {
    decoded.type = ClientMessageType::kMove;
    auto position_it = message.find("position");
    if (position_it == message.end() || !position_it->is_object() || !position_it->contains("x") ||
        !position_it->contains("y") || !ReadInt((*position_it)["x"], decoded.position.x) ||
        !ReadInt((*position_it)["y"], decoded.position.y)) {
      error = "Invalid position";
      return std::nullopt;
    }
  } else if (type == "CHAT") {
    decoded.type = ClientMessageType::kChat;
    if (!ReadString(message, "content", decoded.content)) {
      error = "Invalid chat content";
      return std::nullopt;
    }
  } else if (type == "INTERACT") {
    decoded.type = ClientMessageType::kInteract;
    if (!ReadString(message, "targetId", decoded.target_id)) {
      error = "Invalid targetId";
      return std::nullopt;
    }
  } else if (type == "RUN") {
    decoded.type = ClientMessageType::kRun;
    auto running_it = message.find("isRunning");
    if (running_it == message.end() || !running_it->is_boolean()) {
      error = "Invalid isRunning";
      return std::nullopt;
    }
    decoded.is_running = running_it->get<bool>();
  } else {
    error = "Unknown message type";
    return std::nullopt;
  }
  return decoded;
}

std::string EncodeClientMessage(const ClientMessage& message) {
  nlohmann::json j{{"type", ToString(message.type)}, {"playerId", message.player_id}};
  switch (message.type) {
    case ClientMessageType::kMove:
      j["position"] = ToJson(message.position);
      break;
    case ClientMessageType::kChat:
      j["content"] = message.content;
      break;
    case ClientMessageType::kInteract:
      j["targetId"] = message.target_id;
      break;
    case ClientMessageType::kRun:
      j["isRunning"] = message.is_running;
      break;
  }
  return j.dump();
}

std::optional<ServerMessage> DecodeServerMessage(std::string_view raw, std::string& error) {
  try {
    auto message = nlohmann::json::parse(raw);
    auto type = message.at("type").get<std::string>();
    ServerMessage decoded;
    if (type == "INIT") {
      decoded.type = ServerMessageType::kInit;
      decoded.player_id = message.at("playerId").get<std::string>();
      decoded.game_state = GameStateFromJson(message.at("gameState"));
    } else if (type == "STATE_UPDATE") {
      decoded.type = ServerMessageType::kStateUpdate;
      decoded.game_state = GameStateFromJson(message.at("gameState"));
    } else if (type == "PLAYER_JOINED") {
      decoded.type = ServerMessageType::kPlayerJoined;
      decoded.player = PlayerFromJson(message.at("player"));
      decoded.player_id = decoded.player.id;
    } else if (type == "PLAYER_LEFT") {
      decoded.type = ServerMessageType::kPlayerLeft;
      decoded.player_id = message.at("playerId").get<std::string>();
    } else if (type == "CHAT_MESSAGE") {
      decoded.type = ServerMessageType::kChatMessage;
      decoded.chat = ChatMessageFromJson(message.at("message"));
    } else if (type == "ERROR") {
      decoded.type = ServerMessageType::kError;
      decoded.error = message.at("message").get<std::string>();
    } else {
      error = "unknown server message type: " + type;
      return std::nullopt;
    }
    return decoded;
  } catch (const nlohmann::json::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace gridworld
