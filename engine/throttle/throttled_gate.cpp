#include "throttled_gate.hpp"
#include "engine/common/errors.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace docgate {

ThrottledGate::ThrottledGate(const ThrottleConfig& config)
    : config_(config),
      monitor_(std::make_shared<Monitor>()) {
  config_.Validate();
  state_.window_start = Clock::now();
  SPDLOG_DEBUG("ThrottledGate: created with {}", config_.ToString());
}

void ThrottledGate::Acquire(const CancellationToken& token) {
  AcquireUntil(Clock::time_point::max(), token);
}

bool ThrottledGate::AcquireUntil(Clock::time_point deadline, const CancellationToken& token) {
  // Wake waiters on cancellation. Registered before taking the gate lock:
  // an already-cancelled token runs the callback inline.
  std::shared_ptr<Monitor> monitor = monitor_;
  CancellationRegistration registration(token, [monitor]() {
    std::lock_guard<std::mutex> lock(monitor->mutex);
    monitor->cv.notify_all();
  });

  std::unique_lock<std::mutex> lock(monitor_->mutex);
  bool logged_wait = false;
  while (true) {
    if (token.IsCancelled()) {
      throw InterruptedWait("Wait for throttle admission was cancelled");
    }

    auto now = Clock::now();
    if (RollWindowIfElapsed(now)) {
      monitor_->cv.notify_all();
    }

    if (HasCapacity()) {
      ++state_.admitted;
      ++state_.in_flight;
      return true;
    }

    if (now >= deadline) {
      return false;
    }

    auto window_end = state_.window_start + config_.period;
    if (!logged_wait) {
      SPDLOG_DEBUG("ThrottledGate: saturated (admitted={}, in_flight={}, limit={}), waiting {}ms",
                   state_.admitted, state_.in_flight, config_.limit,
                   std::chrono::duration_cast<std::chrono::milliseconds>(window_end - now).count());
      logged_wait = true;
    }
    monitor_->cv.wait_until(lock, std::min(window_end, deadline));
  }
}

bool ThrottledGate::TryAcquire() {
  std::lock_guard<std::mutex> lock(monitor_->mutex);
  if (RollWindowIfElapsed(Clock::now())) {
    monitor_->cv.notify_all();
  }
  if (!HasCapacity()) {
    return false;
  }
  ++state_.admitted;
  ++state_.in_flight;
  return true;
}

void ThrottledGate::Release() {
  std::lock_guard<std::mutex> lock(monitor_->mutex);
  if (RollWindowIfElapsed(Clock::now())) {
    monitor_->cv.notify_all();
  }
  if (state_.in_flight == 0) {
    SPDLOG_WARN("ThrottledGate: Release() without a matching admission, ignored");
    return;
  }
  --state_.in_flight;
  if (state_.carried_over > 0) {
    // Already charged to the window that admitted it
    --state_.carried_over;
  } else {
    ++state_.count;
  }
}

GateSnapshot ThrottledGate::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(monitor_->mutex);
  GateSnapshot snapshot;
  snapshot.count = state_.count;
  snapshot.admitted = state_.admitted;
  snapshot.in_flight = state_.in_flight;
  snapshot.window_start = state_.window_start;
  return snapshot;
}

int ThrottledGate::Remaining() const {
  std::lock_guard<std::mutex> lock(monitor_->mutex);
  if (Clock::now() - state_.window_start >= config_.period) {
    return config_.limit;
  }
  return std::max(0, config_.limit - state_.admitted);
}

std::chrono::milliseconds ThrottledGate::TimeUntilReset() const {
  std::lock_guard<std::mutex> lock(monitor_->mutex);
  auto window_end = state_.window_start + config_.period;
  auto now = Clock::now();
  if (window_end <= now) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(window_end - now);
}

bool ThrottledGate::RollWindowIfElapsed(Clock::time_point now) {
  if (now - state_.window_start < config_.period) {
    return false;
  }
  SPDLOG_TRACE("ThrottledGate: window reset (completed={}, admitted={}, in_flight={})",
               state_.count, state_.admitted, state_.in_flight);
  state_.count = 0;
  state_.admitted = 0;
  state_.carried_over = state_.in_flight;
  state_.window_start = now;
  return true;
}

}  // namespace docgate
