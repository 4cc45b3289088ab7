// Repository: AudioInject
// Component: System Time Source
// Purpose: Production ITimeSource backed by std::chrono::system_clock.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_TIME_SYSTEM_TIME_SOURCE_HPP_
#define AUDIOINJECT_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "audioinject/time/ITimeSource.hpp"

namespace audioinject::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcUs() const override {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace audioinject::time

#endif  // AUDIOINJECT_TIME_SYSTEM_TIME_SOURCE_HPP_
