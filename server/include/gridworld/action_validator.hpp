/*
 * 설명: 이동 범위 검사와 채팅 정제 규칙을 부수효과 없는 함수로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/action_validator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gridworld {

struct WorldBounds {
  int width{100};
  int height{100};
};

bool IsWithinBounds(const WorldBounds& bounds, int x, int y);

bool IsAllowedChatChar(unsigned char c);

// 앞뒤 공백 제거 -> max_length 코드 포인트로 자르기 -> 허용되지 않은 문자 제거 순서로 처리한다.
std::string SanitizeChat(std::string_view raw, std::size_t max_length);

}  // namespace gridworld
