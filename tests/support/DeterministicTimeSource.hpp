// Repository: AudioInject
// Component: Deterministic Time Source (test only)
// Purpose: Virtual wall clock in microseconds, advanced explicitly by tests
//          or by DeterministicWaitStrategy.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
#define AUDIOINJECT_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

#include <atomic>
#include <cstdint>

#include "audioinject/time/ITimeSource.hpp"

namespace audioinject::testing {

class DeterministicTimeSource : public time::ITimeSource {
 public:
  explicit DeterministicTimeSource(int64_t start_us = 0) : now_us_(start_us) {}

  int64_t NowUtcUs() const override { return now_us_.load(); }

  void AdvanceUs(int64_t delta_us) { now_us_ += delta_us; }
  void AdvanceNs(int64_t delta_ns) { now_us_ += delta_ns / 1000; }

  void SetUs(int64_t value) { now_us_ = value; }

 private:
  std::atomic<int64_t> now_us_;
};

}  // namespace audioinject::testing

#endif  // AUDIOINJECT_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
