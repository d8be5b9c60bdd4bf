/*
 * 설명: 이동 범위 검사와 채팅 정제 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/action_validator_test.cpp
 */
#include "gridworld/action_validator.hpp"

#include <cctype>

namespace gridworld {
namespace {
bool IsSpace(unsigned char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

bool IsContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }
}  // namespace

bool IsWithinBounds(const WorldBounds& bounds, int x, int y) {
  return x >= 0 && x < bounds.width && y >= 0 && y < bounds.height;
}

bool IsAllowedChatChar(unsigned char c) {
  if (c >= 0x80) {
    return false;
  }
  if (std::isalnum(c) || c == '_') {
    return true;
  }
  if (c == '!' || c == '?' || c == '.' || c == ',') {
    return true;
  }
  return IsSpace(c);
}

std::string SanitizeChat(std::string_view raw, std::size_t max_length) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && IsSpace(static_cast<unsigned char>(raw[begin]))) {
    ++begin;
  }
  while (end > begin && IsSpace(static_cast<unsigned char>(raw[end - 1]))) {
    --end;
  }
  auto trimmed = raw.substr(begin, end - begin);

  // UTF-8 코드 포인트 단위로 센다. 다중 바이트 문자는 잘리지 않는다.
  std::size_t cut = trimmed.size();
  std::size_t code_points = 0;
  for (std::size_t i = 0; i < trimmed.size(); ++i) {
    if (IsContinuationByte(static_cast<unsigned char>(trimmed[i]))) {
      continue;
    }
    if (code_points == max_length) {
      cut = i;
      break;
    }
    ++code_points;
  }
  auto truncated = trimmed.substr(0, cut);

  std::string result;
  result.reserve(truncated.size());
  for (char ch : truncated) {
    if (IsAllowedChatChar(static_cast<unsigned char>(ch))) {
      result.push_back(ch);
    }
  }
  return result;
}

}  // namespace gridworld
