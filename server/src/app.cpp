/*
 * 설명: 서버 수명주기와 리스닝, 워커 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "gridworld/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "gridworld/http_session.hpp"

namespace gridworld {
namespace {
unsigned int ResolveThreadCount(const AppConfig& config) {
  return config.worker_threads > 0 ? config.worker_threads : std::max(1u, std::thread::hardware_concurrency());
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<GameServer> game_server, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), game_server_(std::move(game_server)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->game_server_, self->observability_)
                ->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Log(
                LogContext{LogLevel::kWarn, "accept_failed", std::nullopt, std::nullopt, ec.message()});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<GameServer> game_server_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(ResolveThreadCount(config))),
      work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  game_server_ = std::make_shared<GameServer>(ioc_, config_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.address), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, game_server_, observability_);
    listener_->Run();
    bound_port_ = listener_->Port();
    game_server_->Start();
    observability_->Log(LogContext{LogLevel::kInfo, "server_started", std::nullopt, std::nullopt,
                                   config_.address + ":" + std::to_string(bound_port_.load())});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "server_failed", std::nullopt, std::nullopt, ex.what()});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = ResolveThreadCount(config_);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  game_server_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  observability_->Log(LogContext{LogLevel::kInfo, "server_stopped", std::nullopt, std::nullopt, {}});
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&get_env](const char* key, const char* def) -> std::size_t {
    auto value = get_env(key, def);
    std::size_t idx = 0;
    unsigned long parsed = 0;
    try {
      parsed = std::stoul(value, &idx);
    } catch (const std::exception&) {
      throw std::invalid_argument(std::string(key) + " must be a non-negative integer: " + value);
    }
    if (idx != value.size() || value.front() == '-') {
      throw std::invalid_argument(std::string(key) + " must be a non-negative integer: " + value);
    }
    return static_cast<std::size_t>(parsed);
  };

  AppConfig cfg;
  cfg.address = get_env("SERVER_ADDRESS", "0.0.0.0");
  auto port = get_size("SERVER_PORT", "8080");
  if (port > 65535) {
    throw std::invalid_argument("SERVER_PORT out of range: " + std::to_string(port));
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.tick_interval_ms = get_size("TICK_INTERVAL_MS", "600");
  if (cfg.tick_interval_ms == 0) {
    throw std::invalid_argument("TICK_INTERVAL_MS must be positive");
  }
  auto get_extent = [&get_size](const char* key, const char* def) -> int {
    auto value = get_size(key, def);
    if (value == 0 || value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
  };
  cfg.world_width = get_extent("WORLD_WIDTH", "100");
  cfg.world_height = get_extent("WORLD_HEIGHT", "100");
  cfg.chat_history_limit = get_size("CHAT_HISTORY_LIMIT", "100");
  cfg.chat_max_length = get_size("CHAT_MAX_LENGTH", "100");
  cfg.max_players = get_size("MAX_PLAYERS", "2000");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "64");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "4194304");
  cfg.worker_threads = static_cast<unsigned int>(get_size("WORKER_THREADS", "0"));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  return cfg;
}

}  // namespace gridworld
