/*
 * 설명: 게임 코어가 전송 계층과 분리되어 메시지를 보내기 위한 연결 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace gridworld {

using Frame = std::shared_ptr<const std::string>;

class Connection {
 public:
  virtual ~Connection() = default;

  virtual std::uint64_t Id() const = 0;
  // 이미 닫힌 연결이면 false. 실제 쓰기는 비동기로 진행된다.
  virtual bool Send(Frame frame) = 0;
  virtual void Close(std::string_view reason) = 0;
};

std::uint64_t NextConnectionId();

inline Frame MakeFrame(std::string text) { return std::make_shared<const std::string>(std::move(text)); }

}  // namespace gridworld
