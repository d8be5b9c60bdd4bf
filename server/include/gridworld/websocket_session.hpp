/*
 * 설명: WebSocket 연결의 읽기 루프, 백프레셔가 걸린 송신 큐, 종료 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "gridworld/connection.hpp"
#include "gridworld/game_server.hpp"
#include "gridworld/observability.hpp"

namespace gridworld {

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<GameServer> game_server, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;

  void Run();

  std::uint64_t Id() const override { return id_; }
  bool Send(Frame frame) override;
  void Close(std::string_view reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(Frame frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void DoClose(const std::string& reason);
  void NotifyLeave();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<GameServer> game_server_;
  std::shared_ptr<Observability> observability_;
  std::uint64_t id_;
  std::deque<Frame> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  std::atomic<bool> left_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace gridworld
