/*
 * 설명: WebSocket 메시지를 읽어 게임 서버로 넘기고, 백프레셔가 걸린 송신 큐로 서버 메시지를 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/websocket_session.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace gridworld {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<GameServer> game_server,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), game_server_(std::move(game_server)), observability_(std::move(observability)),
      id_(NextConnectionId()), max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  NotifyLeave();
  observability_->WebsocketClosed();
}

void WebSocketSession::Run() {
  ws_.text(true);
  observability_->WebsocketOpened();
  observability_->Log(LogContext{LogLevel::kDebug, "ws_connected", std::nullopt, id_, {}});
  game_server_->Join(shared_from_this());
  DoRead();
}

bool WebSocketSession::Send(Frame frame) {
  if (closing_) {
    return false;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
  return true;
}

void WebSocketSession::Close(std::string_view reason) {
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), reason = std::string(reason)]() { self->DoClose(reason); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed) {
      observability_->Log(LogContext{LogLevel::kDebug, "ws_read_failed", std::nullopt, id_, ec.message()});
    }
    closing_ = true;
    NotifyLeave();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  game_server_->Receive(shared_from_this(), std::move(data));
  DoRead();
}

void WebSocketSession::EnqueueMessage(Frame frame) {
  if (closing_) {
    return;
  }
  const auto message_size = frame->size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    observability_->Log(LogContext{LogLevel::kWarn, "backpressure_exceeded", std::nullopt, id_,
                                   std::to_string(send_queue_.size()) + " queued"});
    DoClose("backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.async_write(boost::asio::buffer(*send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front()->size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    observability_->Log(LogContext{LogLevel::kDebug, "ws_write_failed", std::nullopt, id_, ec.message()});
    closing_ = true;
    NotifyLeave();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::DoClose(const std::string& reason) {
  if (closing_.exchange(true)) {
    return;
  }
  // 진행 중인 쓰기의 버퍼는 완료될 때까지 살아 있어야 한다.
  Frame in_flight = writing_ && !send_queue_.empty() ? send_queue_.front() : nullptr;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (in_flight) {
    queued_bytes_ = in_flight->size();
    send_queue_.push_back(std::move(in_flight));
  }
  NotifyLeave();
  boost::beast::websocket::close_reason close_reason{boost::beast::websocket::close_code::policy_error};
  close_reason.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::NotifyLeave() {
  if (left_.exchange(true)) {
    return;
  }
  game_server_->Leave(id_);
}

}  // namespace gridworld
