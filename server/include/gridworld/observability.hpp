/*
 * 설명: 구조화 로그와 서버 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gridworld {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

enum class ErrorKind { kDecode, kIdentity, kValidation, kDelivery };

std::string_view ToString(ErrorKind kind);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> player_id;
  std::optional<std::uint64_t> connection_id;
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t messages_total{0};
  std::uint64_t decode_errors{0};
  std::uint64_t identity_errors{0};
  std::uint64_t validation_errors{0};
  std::uint64_t delivery_errors{0};
  std::uint64_t ticks{0};
  std::uint64_t websocket_active{0};
  std::uint64_t players_online{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  void IncrementMessages();
  void IncrementError(ErrorKind kind);
  void IncrementTicks();
  void WebsocketOpened();
  void WebsocketClosed();
  void SetPlayersOnline(std::uint64_t count);
  MetricsSnapshot Snapshot() const;
  nlohmann::json SnapshotJson() const;

  bool IsEnabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> messages_total_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> identity_errors_{0};
  std::atomic<std::uint64_t> validation_errors_{0};
  std::atomic<std::uint64_t> delivery_errors_{0};
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> players_online_{0};
  mutable std::mutex log_mutex_;
};

}  // namespace gridworld
