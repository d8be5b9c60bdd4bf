/*
 * 설명: steady_timer 기반 고정 주기 틱 루프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tick_scheduler_test.cpp
 */
#include "gridworld/tick_scheduler.hpp"

#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

namespace gridworld {

TickScheduler::TickScheduler(Strand strand, std::chrono::milliseconds interval, TickHandler handler)
    : strand_(std::move(strand)), timer_(strand_), interval_(interval), handler_(std::move(handler)) {}

void TickScheduler::Start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->running_) {
      return;
    }
    self->running_ = true;
    self->timer_.expires_after(self->interval_);
    self->ScheduleNext();
  });
}

void TickScheduler::Stop() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    self->running_ = false;
    self->timer_.cancel();
  });
}

void TickScheduler::ScheduleNext() {
  auto self = shared_from_this();
  timer_.async_wait(
      boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) { self->OnTimer(ec); }));
}

void TickScheduler::OnTimer(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  // 이전 만료 시각을 기준으로 다음 만료를 잡아 처리 시간만큼 주기가 밀리지 않게 한다.
  timer_.expires_at(timer_.expiry() + interval_);
  handler_();
  if (running_) {
    ScheduleNext();
  }
}

}  // namespace gridworld
