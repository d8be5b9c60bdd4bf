/*
 * 설명: 월드 상태 저장소의 변경/조회 연산과 틱 단위 달리기 에너지 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/world_state_test.cpp
 */
#include "gridworld/world_state.hpp"

#include <algorithm>
#include <chrono>

namespace gridworld {
namespace {
std::int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}
}  // namespace

Player MakeDefaultPlayer(const std::string& id, const std::string& name) {
  Player player;
  player.id = id;
  player.name = name;
  player.position = Position{0, 0};
  player.is_running = false;
  player.run_energy = WorldState::kMaxRunEnergy;
  player.skills = {
      {"attack", 0},
      {"strength", 0},
      {"defence", 0},
      {"hitpoints", 10},
      {"prayer", 0},
      {"magic", 0},
      {"ranged", 0},
      {"mining", 0},
      {"woodcutting", 0},
      {"fishing", 0},
  };
  return player;
}

WorldState::WorldState(WorldLimits limits) : limits_(limits) {}

bool WorldState::ApplyMove(const std::string& player_id, const Position& position) {
  if (!IsWithinBounds(limits_.bounds, position.x, position.y)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.players.find(player_id);
  if (it == state_.players.end()) {
    return false;
  }
  it->second.position = position;
  return true;
}

std::optional<ChatMessage> WorldState::AppendChat(const std::string& player_name, const std::string& raw_content) {
  auto content = SanitizeChat(raw_content, limits_.chat_max_length);
  if (content.empty()) {
    return std::nullopt;
  }
  ChatMessage message{player_name, std::move(content), NowEpochMillis()};

  std::lock_guard<std::mutex> lock(mutex_);
  if (limits_.chat_history_limit == 0) {
    return message;
  }
  while (state_.chat_messages.size() >= limits_.chat_history_limit) {
    state_.chat_messages.pop_front();
  }
  state_.chat_messages.push_back(message);
  return message;
}

bool WorldState::SetRunning(const std::string& player_id, bool running) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.players.find(player_id);
  if (it == state_.players.end()) {
    return false;
  }
  if (running && it->second.run_energy <= 0.0) {
    return false;
  }
  it->second.is_running = running;
  return true;
}

void WorldState::UpsertPlayer(const std::string& player_id, const Player& player) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.players[player_id] = player;
}

bool WorldState::RemovePlayer(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.players.erase(player_id) > 0;
}

void WorldState::UpsertWorldObject(const WorldObject& object) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.world_objects[object.id] = object;
}

std::optional<Player> WorldState::FindPlayer(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.players.find(player_id);
  if (it == state_.players.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool WorldState::HasPlayer(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.players.count(player_id) > 0;
}

std::size_t WorldState::PlayerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.players.size();
}

std::uint64_t WorldState::AdvanceTick() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++state_.tick;
  ProcessRunEnergy();
  return state_.tick;
}

void WorldState::ProcessRunEnergy() {
  for (auto& entry : state_.players) {
    auto& player = entry.second;
    if (player.is_running) {
      player.run_energy = std::max(0.0, player.run_energy - kRunDrainPerTick);
      if (player.run_energy <= 0.0) {
        player.is_running = false;
      }
    }
    // 이번 틱에 달리기가 끝난 플레이어도 같은 틱에 회복을 시작한다.
    if (!player.is_running && player.run_energy < kMaxRunEnergy) {
      player.run_energy = std::min(kMaxRunEnergy, player.run_energy + kRunRegenPerTick);
    }
  }
}

GameState WorldState::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

}  // namespace gridworld
