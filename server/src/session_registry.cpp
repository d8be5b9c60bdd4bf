/*
 * 설명: 연결별 플레이어 식별자 발급/회수와 세션 대상 전송을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "gridworld/session_registry.hpp"

#include <utility>
#include <vector>

#include <boost/uuid/uuid_io.hpp>

namespace gridworld {

SessionRegistry::SessionRegistry(WorldState& world, std::shared_ptr<Observability> observability)
    : world_(world), observability_(std::move(observability)) {}

std::string SessionRegistry::GenerateId() {
  std::string id;
  do {
    id = boost::uuids::to_string(uuid_generator_());
  } while (player_to_connection_.count(id) > 0 || world_.HasPlayer(id));
  return id;
}

std::string SessionRegistry::OnConnect(const std::shared_ptr<Connection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = sessions_.find(connection->Id());
  if (existing != sessions_.end()) {
    return existing->second.player_id;
  }
  auto player_id = GenerateId();
  ++join_counter_;
  world_.UpsertPlayer(player_id, MakeDefaultPlayer(player_id, "Player" + std::to_string(join_counter_)));
  sessions_[connection->Id()] = Entry{connection, player_id};
  player_to_connection_[player_id] = connection->Id();
  if (observability_) {
    observability_->SetPlayersOnline(sessions_.size());
  }
  return player_id;
}

std::optional<std::string> SessionRegistry::OnDisconnect(std::uint64_t connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(connection_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  auto player_id = it->second.player_id;
  world_.RemovePlayer(player_id);
  player_to_connection_.erase(player_id);
  sessions_.erase(it);
  if (observability_) {
    observability_->SetPlayersOnline(sessions_.size());
  }
  return player_id;
}

std::optional<std::string> SessionRegistry::FindPlayerId(std::uint64_t connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(connection_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second.player_id;
}

bool SessionRegistry::SendTo(std::uint64_t connection_id, const Frame& frame) {
  std::shared_ptr<Connection> connection;
  std::string player_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(connection_id);
    if (it == sessions_.end()) {
      return false;
    }
    connection = it->second.connection.lock();
    player_id = it->second.player_id;
  }
  return Deliver(connection_id, connection, player_id, frame);
}

std::size_t SessionRegistry::Broadcast(const Frame& frame, std::optional<std::uint64_t> exclude) {
  struct Target {
    std::uint64_t connection_id;
    std::shared_ptr<Connection> connection;
    std::string player_id;
  };
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(sessions_.size());
    for (const auto& [connection_id, entry] : sessions_) {
      if (exclude && *exclude == connection_id) {
        continue;
      }
      targets.push_back(Target{connection_id, entry.connection.lock(), entry.player_id});
    }
  }

  std::size_t delivered = 0;
  for (const auto& target : targets) {
    if (Deliver(target.connection_id, target.connection, target.player_id, frame)) {
      ++delivered;
    }
  }
  return delivered;
}

bool SessionRegistry::Deliver(std::uint64_t connection_id, const std::shared_ptr<Connection>& connection,
                              const std::string& player_id, const Frame& frame) {
  if (connection && connection->Send(frame)) {
    return true;
  }
  if (observability_) {
    observability_->IncrementError(ErrorKind::kDelivery);
    observability_->Log(LogContext{LogLevel::kWarn, "delivery_failed", player_id, connection_id,
                                   connection ? "connection closed" : "connection expired"});
  }
  return false;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace gridworld
