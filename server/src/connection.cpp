/*
 * 설명: 프로세스 전역에서 유일한 연결 식별자를 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "gridworld/connection.hpp"

#include <atomic>

namespace gridworld {

std::uint64_t NextConnectionId() {
  static std::atomic<std::uint64_t> counter{0};
  return counter.fetch_add(1) + 1;
}

}  // namespace gridworld
