/*
 * 설명: 살아있는 연결과 플레이어 식별자의 양방향 매핑과 연결 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/uuid/random_generator.hpp>

#include "gridworld/connection.hpp"
#include "gridworld/observability.hpp"
#include "gridworld/world_state.hpp"

namespace gridworld {

class SessionRegistry {
 public:
  SessionRegistry(WorldState& world, std::shared_ptr<Observability> observability);

  // 새 식별자를 발급하고 기본 플레이어를 월드에 넣는다.
  std::string OnConnect(const std::shared_ptr<Connection>& connection);
  // 등록되지 않은 연결이면 std::nullopt. 두 번째 호출부터는 항상 std::nullopt.
  std::optional<std::string> OnDisconnect(std::uint64_t connection_id);

  std::optional<std::string> FindPlayerId(std::uint64_t connection_id) const;
  bool SendTo(std::uint64_t connection_id, const Frame& frame);
  // 한 수신자의 실패는 나머지 전송을 막지 않는다. 전달 성공 수를 반환한다.
  std::size_t Broadcast(const Frame& frame, std::optional<std::uint64_t> exclude = std::nullopt);
  std::size_t Size() const;

 private:
  struct Entry {
    std::weak_ptr<Connection> connection;
    std::string player_id;
  };

  std::string GenerateId();
  bool Deliver(std::uint64_t connection_id, const std::shared_ptr<Connection>& connection,
               const std::string& player_id, const Frame& frame);

  WorldState& world_;
  std::shared_ptr<Observability> observability_;
  std::map<std::uint64_t, Entry> sessions_;
  std::unordered_map<std::string, std::uint64_t> player_to_connection_;
  boost::uuids::random_generator uuid_generator_;
  std::uint64_t join_counter_{0};
  mutable std::mutex mutex_;
};

}  // namespace gridworld
