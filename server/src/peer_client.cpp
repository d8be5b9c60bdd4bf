/*
 * 설명: 동기식 WebSocket 피어 구현. 서버 메시지를 로컬 미러에 반영하고 입력을 엔벨로프로 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/peer_client.hpp"

#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace gridworld {
namespace {
constexpr std::size_t kMirrorChatLimit = 100;
}  // namespace

PeerClient::PeerClient() = default;

PeerClient::~PeerClient() { Close(); }

void PeerClient::Connect(const std::string& host, unsigned short port, const std::string& target) {
  ws_ = std::make_unique<WebSocket>(ioc_);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  auto const results = resolver.resolve(host, std::to_string(port));
  ws_->next_layer().connect(results);
  ws_->set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::request_type& req) {
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING " gridworld-peer");
  }));
  ws_->handshake(host + ":" + std::to_string(port), target);
  ws_->text(true);
}

void PeerClient::Close() {
  if (!IsOpen()) {
    return;
  }
  boost::beast::error_code ec;
  ws_->close(boost::beast::websocket::close_code::normal, ec);
  ws_.reset();
}

bool PeerClient::IsOpen() const { return ws_ && ws_->is_open(); }

ServerMessage PeerClient::ReadNext() {
  if (!ws_) {
    throw std::runtime_error("peer is not connected");
  }
  buffer_.consume(buffer_.size());
  ws_->read(buffer_);
  auto raw = boost::beast::buffers_to_string(buffer_.cdata());
  std::string error;
  auto message = DecodeServerMessage(raw, error);
  if (!message) {
    throw std::runtime_error("failed to decode server message: " + error);
  }
  Apply(*message);
  return *message;
}

ServerMessage PeerClient::ReadUntil(ServerMessageType type, std::size_t max_messages) {
  for (std::size_t i = 0; i < max_messages; ++i) {
    auto message = ReadNext();
    if (message.type == type) {
      return message;
    }
  }
  throw std::runtime_error("message not received: " + std::string(ToString(type)));
}

void PeerClient::Move(int x, int y) {
  ClientMessage message;
  message.type = ClientMessageType::kMove;
  message.player_id = player_id_;
  message.position = Position{x, y};
  Send(message);
}

void PeerClient::Chat(const std::string& content) {
  ClientMessage message;
  message.type = ClientMessageType::kChat;
  message.player_id = player_id_;
  message.content = content;
  Send(message);
}

void PeerClient::Interact(const std::string& target_id) {
  ClientMessage message;
  message.type = ClientMessageType::kInteract;
  message.player_id = player_id_;
  message.target_id = target_id;
  Send(message);
}

void PeerClient::SetRunning(bool running) {
  ClientMessage message;
  message.type = ClientMessageType::kRun;
  message.player_id = player_id_;
  message.is_running = running;
  Send(message);
}

void PeerClient::Send(const ClientMessage& message) { SendRaw(EncodeClientMessage(message)); }

void PeerClient::SendRaw(const std::string& text) {
  if (!ws_) {
    throw std::runtime_error("peer is not connected");
  }
  ws_->write(boost::asio::buffer(text));
}

void PeerClient::Apply(const ServerMessage& message) {
  switch (message.type) {
    case ServerMessageType::kInit:
      player_id_ = message.player_id;
      mirror_ = message.game_state;
      break;
    case ServerMessageType::kStateUpdate:
      mirror_ = message.game_state;
      break;
    case ServerMessageType::kPlayerJoined:
      mirror_.players[message.player.id] = message.player;
      break;
    case ServerMessageType::kPlayerLeft:
      mirror_.players.erase(message.player_id);
      break;
    case ServerMessageType::kChatMessage:
      mirror_.chat_messages.push_back(message.chat);
      while (mirror_.chat_messages.size() > kMirrorChatLimit) {
        mirror_.chat_messages.pop_front();
      }
      break;
    case ServerMessageType::kError:
      break;
  }
}

}  // namespace gridworld
