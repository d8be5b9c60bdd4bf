/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>
#include <stdexcept>

#include <boost/asio/signal_set.hpp>

#include "gridworld/app.hpp"

int main() {
  using namespace gridworld;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int /*signal_number*/) {
    if (!ec) {
      app.GetGameServer()->Stop();
      app.GetContext().stop();
    }
  });

  app.Run();
  app.Stop();
  return 0;
}
