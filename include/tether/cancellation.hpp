#pragma once

#include <atomic>
#include <memory>

namespace tether {

/// Cooperative cancellation flag shared between a requester and a worker.
/// Copies observe and trip the same state.
class cancel_token {
 public:
  cancel_token() : state_{std::make_shared<std::atomic_bool>(false)} {}

  void request() const { state_->store(true, std::memory_order_release); }

  [[nodiscard]] bool requested() const {
    return state_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic_bool> state_;
};

}  // namespace tether
