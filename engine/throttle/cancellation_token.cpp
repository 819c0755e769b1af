#include "cancellation_token.hpp"

#include <vector>

namespace docgate {

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      return;  // Already cancelled
    }
    for (auto& entry : state_->callbacks) {
      callbacks.push_back(std::move(entry.second));
    }
    state_->callbacks.clear();
  }

  for (auto& callback : callbacks) {
    callback();
  }
}

CancellationRegistration::CancellationRegistration(const CancellationToken& token,
                                                   std::function<void()> callback)
    : state_(token.state_) {
  if (!state_ || !callback) {
    state_.reset();
    return;
  }

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled.load(std::memory_order_acquire)) {
      id_ = state_->next_id++;
      state_->callbacks.emplace(id_, std::move(callback));
      return;
    }
  }

  // Token was cancelled before we could register
  state_.reset();
  callback();
}

CancellationRegistration::~CancellationRegistration() {
  if (!state_) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->callbacks.erase(id_);
}

}  // namespace docgate
