#pragma once

#include "engine/throttle/cancellation_token.hpp"
#include "engine/throttle/throttle_config.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace docgate {

// Copy of the gate state taken under the gate lock
struct GateSnapshot {
  int count = 0;       ///< Completions charged to the current window
  int admitted = 0;    ///< Admissions granted in the current window
  int in_flight = 0;   ///< Admitted (in any window), completion not yet reported
  std::chrono::steady_clock::time_point window_start;
};

/**
 * @brief Fixed-window throttle shared by concurrent callers
 *
 * Admits at most config.limit operations per window of config.period.
 * Callers over budget block until the window resets; the gate never
 * rejects a request, it only delays it.
 *
 * Admission and completion are separate steps:
 *  - Acquire() grants one of the window's limit admissions,
 *  - Release() reports that the guarded operation finished, successfully or
 *    not. The completion is charged to count when it belongs to an
 *    admission of the current window.
 *
 * A new caller is admitted while admitted < limit, so count <= admitted <=
 * limit at every observation. A reset starts the budget over regardless of
 * how many operations are still in flight; those are carried over and their
 * completions are not charged to the new window. Releases are matched to
 * carried-over admissions first.
 *
 * Windows roll lazily: the first call observing now - window_start >= period
 * clears count and admitted and starts a new window at now. A blocked caller
 * therefore waits at most one period.
 *
 * Waiting releases the lock (condition variable bounded by the window end),
 * so waiters never serialize each other or completions.
 */
class ThrottledGate {
 public:
  using Clock = std::chrono::steady_clock;

  // Throws ValidationError for a non-positive limit or period
  explicit ThrottledGate(const ThrottleConfig& config);
  ~ThrottledGate() = default;

  // Non-copyable, non-movable (waiters hold references)
  ThrottledGate(const ThrottledGate&) = delete;
  ThrottledGate& operator=(const ThrottledGate&) = delete;
  ThrottledGate(ThrottledGate&&) = delete;
  ThrottledGate& operator=(ThrottledGate&&) = delete;

  /**
   * @brief Block until an admission is reserved for this caller
   *
   * @throws InterruptedWait if token is cancelled before admission; nothing
   *         is consumed in that case.
   */
  void Acquire(const CancellationToken& token = CancellationToken());

  /**
   * @brief Acquire with a deadline
   *
   * @return true when admitted, false when the deadline passed first
   * @throws InterruptedWait if token is cancelled before admission
   */
  bool AcquireUntil(Clock::time_point deadline,
                    const CancellationToken& token = CancellationToken());

  template <typename Rep, typename Period>
  bool AcquireFor(const std::chrono::duration<Rep, Period>& timeout,
                  const CancellationToken& token = CancellationToken()) {
    auto now = Clock::now();
    // Clamp so huge timeouts wait forever instead of overflowing
    using Seconds = std::chrono::duration<double>;
    if (Seconds(timeout) >= Seconds(Clock::time_point::max() - now)) {
      return AcquireUntil(Clock::time_point::max(), token);
    }
    return AcquireUntil(now + std::chrono::duration_cast<Clock::duration>(timeout), token);
  }

  // Reserve an admission without blocking. Returns true if admitted.
  bool TryAcquire();

  // Report completion of one admitted operation
  void Release();

  GateSnapshot GetSnapshot() const;

  // Admissions still available in the current window
  int Remaining() const;

  // Time until the current window ends (zero once it has elapsed)
  std::chrono::milliseconds TimeUntilReset() const;

  const ThrottleConfig& GetConfig() const { return config_; }

 private:
  struct Monitor {
    std::mutex mutex;
    std::condition_variable cv;
  };

  struct GateState {
    int count = 0;
    int admitted = 0;
    int in_flight = 0;
    int carried_over = 0;  // In flight from earlier windows
    Clock::time_point window_start;
  };

  // Caller holds monitor_->mutex. Returns true if a new window started.
  bool RollWindowIfElapsed(Clock::time_point now);

  bool HasCapacity() const { return state_.admitted < config_.limit; }

  const ThrottleConfig config_;
  // Shared with cancellation callbacks, which may outlive the gate
  std::shared_ptr<Monitor> monitor_;
  GateState state_;
};

/**
 * @brief Reports completion to the gate when it goes out of scope
 *
 * Construct it right after a successful Acquire() so the slot is released
 * on every exit path of the guarded operation.
 */
class ScopedAdmission {
 public:
  explicit ScopedAdmission(ThrottledGate& gate) : gate_(&gate) {}
  ~ScopedAdmission() {
    if (gate_) {
      gate_->Release();
    }
  }

  ScopedAdmission(const ScopedAdmission&) = delete;
  ScopedAdmission& operator=(const ScopedAdmission&) = delete;
  ScopedAdmission(ScopedAdmission&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
  ScopedAdmission& operator=(ScopedAdmission&&) = delete;

 private:
  ThrottledGate* gate_;
};

}  // namespace docgate
