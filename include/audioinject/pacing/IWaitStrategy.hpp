// Repository: AudioInject
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in Pacer.
//          Production: RealtimeWaitStrategy sleeps until deadline.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_PACING_IWAIT_STRATEGY_HPP_
#define AUDIOINJECT_PACING_IWAIT_STRATEGY_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace audioinject::pacing {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Block until `deadline`.  Returns false if the wait was cut short by
  // Interrupt() (or an external stop request); the caller must not emit.
  virtual bool WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;

  // Wake any current wait and make all later waits return false at once.
  // Safe to call from any thread.  Idempotent.
  virtual void Interrupt() = 0;
};

// Sleeps on a condition variable until the deadline.
//
// stop_flag (optional, not owned) is polled every kStopPollInterval so that a
// flag raised from a signal handler, where notifying a condition variable is
// not allowed, still ends the wait promptly.
class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  static constexpr std::chrono::milliseconds kStopPollInterval{5};

  explicit RealtimeWaitStrategy(const std::atomic<bool>* stop_flag = nullptr)
      : stop_flag_(stop_flag) {}

  bool WaitUntil(std::chrono::steady_clock::time_point deadline) override;
  void Interrupt() override;

 private:
  bool StopRequested() const;

  const std::atomic<bool>* stop_flag_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

}  // namespace audioinject::pacing

#endif  // AUDIOINJECT_PACING_IWAIT_STRATEGY_HPP_
