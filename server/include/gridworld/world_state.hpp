/*
 * 설명: 플레이어, 채팅 기록, 월드 오브젝트, 틱 카운터를 보관하는 권위 있는 월드 상태 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/world_state_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gridworld/action_validator.hpp"

namespace gridworld {

struct Position {
  int x{0};
  int y{0};

  bool operator==(const Position& other) const { return x == other.x && y == other.y; }
};

struct Item {
  std::string id;
  std::string name;
  bool stackable{false};
  int quantity{0};
};

struct Player {
  std::string id;
  std::string name;
  Position position;
  bool is_running{false};
  double run_energy{100.0};
  std::vector<Item> inventory;
  std::map<std::string, int> skills;
};

struct ChatMessage {
  std::string player_name;
  std::string content;
  std::int64_t timestamp{0};
};

struct WorldObject {
  std::string id;
  std::string type;
  Position position;
};

struct GameState {
  std::uint64_t tick{0};
  std::map<std::string, Player> players;
  std::deque<ChatMessage> chat_messages;
  std::map<std::string, WorldObject> world_objects;
};

struct WorldLimits {
  WorldBounds bounds;
  std::size_t chat_history_limit{100};
  std::size_t chat_max_length{100};
};

Player MakeDefaultPlayer(const std::string& id, const std::string& name);

class WorldState {
 public:
  static constexpr double kMaxRunEnergy = 100.0;
  static constexpr double kRunDrainPerTick = 0.67;
  static constexpr double kRunRegenPerTick = 0.45;

  explicit WorldState(WorldLimits limits = {});

  // 범위를 벗어나거나 존재하지 않는 플레이어면 false를 반환하고 상태는 바뀌지 않는다.
  bool ApplyMove(const std::string& player_id, const Position& position);

  // 정제 결과가 비면 std::nullopt.
  std::optional<ChatMessage> AppendChat(const std::string& player_name, const std::string& raw_content);

  bool SetRunning(const std::string& player_id, bool running);

  void UpsertPlayer(const std::string& player_id, const Player& player);
  bool RemovePlayer(const std::string& player_id);
  void UpsertWorldObject(const WorldObject& object);

  std::optional<Player> FindPlayer(const std::string& player_id) const;
  bool HasPlayer(const std::string& player_id) const;
  std::size_t PlayerCount() const;

  // 틱을 정확히 1 증가시키고 달리기 에너지를 갱신한 뒤 새 틱 값을 반환한다.
  std::uint64_t AdvanceTick();

  GameState Snapshot() const;
  const WorldLimits& Limits() const { return limits_; }

 private:
  void ProcessRunEnergy();

  WorldLimits limits_;
  GameState state_;
  mutable std::mutex mutex_;
};

}  // namespace gridworld
