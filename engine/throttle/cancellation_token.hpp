#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace docgate {

namespace detail {

struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::mutex mutex;
  uint64_t next_id = 1;
  std::map<uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

class CancellationRegistration;

/**
 * @brief Observer side of a cancellation flag
 *
 * Cheap to copy. A default-constructed token is never cancelled.
 */
class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const { return state_ && state_->cancelled.load(std::memory_order_acquire); }

  // False for tokens that can never be cancelled
  bool CanBeCancelled() const { return state_ != nullptr; }

 private:
  friend class CancellationSource;
  friend class CancellationRegistration;

  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner side of a cancellation flag
 *
 * Cancel() is idempotent and runs every registered callback exactly once,
 * on the cancelling thread, outside the internal lock.
 */
class CancellationSource {
 public:
  CancellationSource();

  CancellationToken GetToken() const { return CancellationToken(state_); }

  void Cancel();

  bool IsCancelled() const { return state_->cancelled.load(std::memory_order_acquire); }

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Scoped callback on a token
 *
 * The callback runs when the token is cancelled while the registration is
 * alive. Registering on an already-cancelled token runs the callback
 * immediately in the constructor. The callback must not capture anything
 * that can die before the registration does.
 */
class CancellationRegistration {
 public:
  CancellationRegistration(const CancellationToken& token, std::function<void()> callback);
  ~CancellationRegistration();

  CancellationRegistration(const CancellationRegistration&) = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;

 private:
  std::shared_ptr<detail::CancellationState> state_;
  uint64_t id_ = 0;
};

}  // namespace docgate
