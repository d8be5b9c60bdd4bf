/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace gridworld {

struct AppConfig {
  std::string address{"0.0.0.0"};
  unsigned short port{8080};
  std::size_t tick_interval_ms{600};
  int world_width{100};
  int world_height{100};
  std::size_t chat_history_limit{100};
  std::size_t chat_max_length{100};
  std::size_t max_players{2000};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{4 * 1024 * 1024};
  unsigned int worker_threads{0};
  std::string log_level{"info"};
};

// 잘못된 숫자 값이면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace gridworld
