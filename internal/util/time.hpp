#pragma once

#include <chrono>
#include <cstdint>

namespace reaper::util {

/*
  Wall-clock helpers. Lease timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

/*
  Injectable clock.

  Components that compare lease ages take a ClockSource so tests can
  drive time explicitly.
*/
class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClockSource final : public ClockSource {
 public:
  TimePoint Now() const override;
};

} // namespace reaper::util
