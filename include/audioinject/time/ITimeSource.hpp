// Repository: AudioInject
// Component: Time Source Interface
// Purpose: Wall-clock reads behind an interface so tests can run on virtual time.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_TIME_ITIME_SOURCE_HPP_
#define AUDIOINJECT_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace audioinject::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  // Microseconds since the Unix epoch.
  virtual int64_t NowUtcUs() const = 0;
};

}  // namespace audioinject::time

#endif  // AUDIOINJECT_TIME_ITIME_SOURCE_HPP_
