/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭 응답과 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/http_session.hpp"

#include <chrono>

#include <boost/beast/version.hpp>

#include "gridworld/protocol.hpp"
#include "gridworld/websocket_session.hpp"

namespace gridworld {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<GameServer> game_server, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), game_server_(std::move(game_server)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<http::response<http::string_body>>();
  res->version(req_.version());
  res->set(http::field::server, "gridworld-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target = std::string(req_.target());
  std::string path = target.substr(0, target.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(payload).dump();
    res->prepare_payload();
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto data = observability_->SnapshotJson();
    data["tickIntervalMs"] = config_.tick_interval_ms;
    data["world"] = {{"width", config_.world_width}, {"height", config_.world_height}};
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(data).dump();
    res->prepare_payload();
    return SendResponse(res);
  }

  res->result(http::status::not_found);
  res->body() = MakeErrorEnvelope("not_found", "unsupported path").dump();
  res->prepare_payload();
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  observability_->Log(LogContext{LogLevel::kDebug, "http_request", std::nullopt, std::nullopt,
                                 std::string(req_.target()) + " " + std::to_string(res->result_int())});
  auto self = shared_from_this();
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket() {
  // 업그레이드 이후에는 WebSocket 자체 타임아웃 정책을 쓴다.
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "gridworld-server");
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), game_server_, observability_, config_.ws_queue_limit_messages,
                                       config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::system::system_error& ex) {
    observability_->Log(LogContext{LogLevel::kWarn, "ws_accept_failed", std::nullopt, std::nullopt, ex.what()});
  }
}

}  // namespace gridworld
