/*
 * 설명: 서버 프로토콜을 사용하는 동기식 WebSocket 피어. 로컬 GameState 미러를 유지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket.hpp>

#include "gridworld/protocol.hpp"
#include "gridworld/world_state.hpp"

namespace gridworld {

class PeerClient {
 public:
  PeerClient();
  ~PeerClient();

  PeerClient(const PeerClient&) = delete;
  PeerClient& operator=(const PeerClient&) = delete;

  // 실패하면 boost::system::system_error를 던진다.
  void Connect(const std::string& host, unsigned short port, const std::string& target = "/");
  void Close();
  bool IsOpen() const;

  // 다음 서버 메시지를 읽어 미러에 반영한다. 디코딩 실패 시 std::runtime_error.
  ServerMessage ReadNext();
  ServerMessage ReadUntil(ServerMessageType type, std::size_t max_messages = 1000);

  void Move(int x, int y);
  void Chat(const std::string& content);
  void Interact(const std::string& target_id);
  void SetRunning(bool running);
  void Send(const ClientMessage& message);
  void SendRaw(const std::string& text);

  const std::string& PlayerId() const { return player_id_; }
  const GameState& Mirror() const { return mirror_; }

 private:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void Apply(const ServerMessage& message);

  boost::asio::io_context ioc_;
  std::unique_ptr<WebSocket> ws_;
  boost::beast::flat_buffer buffer_;
  std::string player_id_;
  GameState mirror_;
};

}  // namespace gridworld
