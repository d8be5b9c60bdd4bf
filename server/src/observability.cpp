/*
 * 설명: 구조화 로그와 서버 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "gridworld/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gridworld {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&itt);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kDecode:
      return "decode";
    case ErrorKind::kIdentity:
      return "identity";
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kDelivery:
      return "delivery";
  }
  return "unknown";
}

void Observability::IncrementMessages() { messages_total_.fetch_add(1); }

void Observability::IncrementError(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kDecode:
      decode_errors_.fetch_add(1);
      break;
    case ErrorKind::kIdentity:
      identity_errors_.fetch_add(1);
      break;
    case ErrorKind::kValidation:
      validation_errors_.fetch_add(1);
      break;
    case ErrorKind::kDelivery:
      delivery_errors_.fetch_add(1);
      break;
  }
}

void Observability::IncrementTicks() { ticks_.fetch_add(1); }

void Observability::WebsocketOpened() { websocket_active_.fetch_add(1); }

void Observability::WebsocketClosed() { websocket_active_.fetch_sub(1); }

void Observability::SetPlayersOnline(std::uint64_t count) { players_online_.store(count); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.messages_total = messages_total_.load();
  snapshot.decode_errors = decode_errors_.load();
  snapshot.identity_errors = identity_errors_.load();
  snapshot.validation_errors = validation_errors_.load();
  snapshot.delivery_errors = delivery_errors_.load();
  snapshot.ticks = ticks_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.players_online = players_online_.load();
  return snapshot;
}

nlohmann::json Observability::SnapshotJson() const {
  auto snapshot = Snapshot();
  return {{"messages", {{"total", snapshot.messages_total}}},
          {"errors",
           {{"decode", snapshot.decode_errors},
            {"identity", snapshot.identity_errors},
            {"validation", snapshot.validation_errors},
            {"delivery", snapshot.delivery_errors}}},
          {"ticks", snapshot.ticks},
          {"connections", {{"websocket", snapshot.websocket_active}}},
          {"players", {{"online", snapshot.players_online}}}};
}

void Observability::Log(const LogContext& ctx) const {
  if (!IsEnabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = CurrentTimestamp();
  log_json["level"] = ToString(ctx.level);
  log_json["event"] = ctx.name;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // 여러 워커 스레드의 로그 줄이 섞이지 않게 한다.
  std::lock_guard<std::mutex> lock(log_mutex_);
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace gridworld
