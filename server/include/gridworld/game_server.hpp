/*
 * 설명: 월드 상태, 세션 레지스트리, 디스패처, 틱 스케줄러를 하나의 스트랜드 위에서 직렬화해 구동한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "gridworld/config.hpp"
#include "gridworld/connection.hpp"
#include "gridworld/message_dispatcher.hpp"
#include "gridworld/observability.hpp"
#include "gridworld/session_registry.hpp"
#include "gridworld/tick_scheduler.hpp"
#include "gridworld/world_state.hpp"

namespace gridworld {

class GameServer : public std::enable_shared_from_this<GameServer> {
 public:
  GameServer(boost::asio::io_context& ioc, const AppConfig& config, std::shared_ptr<Observability> observability);

  void Start();
  void Stop();

  // 아래 세 함수는 어느 스레드에서 호출해도 게임 스트랜드에서 도착 순서대로 처리된다.
  void Join(std::shared_ptr<Connection> connection);
  void Receive(std::shared_ptr<Connection> connection, std::string payload);
  void Leave(std::uint64_t connection_id);

  std::size_t PlayerCount() const { return world_.PlayerCount(); }
  GameState Snapshot() const { return world_.Snapshot(); }

 private:
  void OnTick();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Observability> observability_;
  WorldState world_;
  SessionRegistry registry_;
  MessageDispatcher dispatcher_;
  std::shared_ptr<TickScheduler> scheduler_;
  std::atomic<bool> stopped_{false};
};

}  // namespace gridworld
