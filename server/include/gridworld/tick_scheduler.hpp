/*
 * 설명: 고정 주기 타이머로 틱 핸들러를 호출한다. 입력 트래픽과 무관하게 주기를 유지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tick_scheduler_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace gridworld {

class TickScheduler : public std::enable_shared_from_this<TickScheduler> {
 public:
  using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
  using TickHandler = std::function<void()>;

  TickScheduler(Strand strand, std::chrono::milliseconds interval, TickHandler handler);

  void Start();
  void Stop();
  std::chrono::milliseconds Interval() const { return interval_; }

 private:
  void ScheduleNext();
  void OnTimer(const boost::system::error_code& ec);

  Strand strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  TickHandler handler_;
  bool running_{false};
};

}  // namespace gridworld
