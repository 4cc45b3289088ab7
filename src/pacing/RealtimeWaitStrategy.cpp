// Repository: AudioInject
// Component: Realtime Wait Strategy
// Purpose: Interruptible sleep-until-deadline for production pacing.
// Copyright (c) 2026 AudioInject

#include <algorithm>

#include "audioinject/pacing/IWaitStrategy.hpp"

namespace audioinject::pacing {

bool RealtimeWaitStrategy::StopRequested() const {
  return stop_flag_ != nullptr && stop_flag_->load(std::memory_order_acquire);
}

bool RealtimeWaitStrategy::WaitUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (interrupted_ || StopRequested()) return false;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;
    auto slice_end = deadline;
    if (stop_flag_ != nullptr) {
      slice_end = std::min(deadline, now + kStopPollInterval);
    }
    cv_.wait_until(lock, slice_end, [this] { return interrupted_; });
  }
}

void RealtimeWaitStrategy::Interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

}  // namespace audioinject::pacing
