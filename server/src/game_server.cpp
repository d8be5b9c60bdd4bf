/*
 * 설명: 게임 스트랜드에서 입장/메시지/퇴장/틱을 순서대로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/game_server.hpp"

#include <utility>

#include <boost/asio/post.hpp>

namespace gridworld {
namespace {
WorldLimits LimitsFromConfig(const AppConfig& config) {
  WorldLimits limits;
  limits.bounds = WorldBounds{config.world_width, config.world_height};
  limits.chat_history_limit = config.chat_history_limit;
  limits.chat_max_length = config.chat_max_length;
  return limits;
}
}  // namespace

GameServer::GameServer(boost::asio::io_context& ioc, const AppConfig& config,
                       std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), observability_(std::move(observability)),
      world_(LimitsFromConfig(config)), registry_(world_, observability_),
      dispatcher_(world_, registry_, observability_, config.max_players) {
  scheduler_ = std::make_shared<TickScheduler>(strand_, std::chrono::milliseconds(config.tick_interval_ms),
                                               [this]() { OnTick(); });
}

void GameServer::Start() {
  stopped_ = false;
  scheduler_->Start();
  observability_->Log(LogContext{LogLevel::kInfo, "tick_loop_started", std::nullopt, std::nullopt,
                                 std::to_string(scheduler_->Interval().count()) + "ms"});
}

void GameServer::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  scheduler_->Stop();
  observability_->Log(LogContext{LogLevel::kInfo, "tick_loop_stopped", std::nullopt, std::nullopt, {}});
}

void GameServer::Join(std::shared_ptr<Connection> connection) {
  if (stopped_) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this(), connection = std::move(connection)]() {
    self->dispatcher_.HandleConnect(connection);
  });
}

void GameServer::Receive(std::shared_ptr<Connection> connection, std::string payload) {
  if (stopped_) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this(), connection = std::move(connection),
                              payload = std::move(payload)]() { self->dispatcher_.HandleMessage(connection, payload); });
}

void GameServer::Leave(std::uint64_t connection_id) {
  if (stopped_) {
    return;
  }
  boost::asio::post(strand_,
                    [self = shared_from_this(), connection_id]() { self->dispatcher_.HandleDisconnect(connection_id); });
}

void GameServer::OnTick() {
  world_.AdvanceTick();
  observability_->IncrementTicks();
  dispatcher_.BroadcastState();
}

}  // namespace gridworld
