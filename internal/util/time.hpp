#pragma once

#include <chrono>
#include <string>

namespace pbxpatch::util {

/*
  Time utilities, single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Local time as YYYYmmdd_HHMMSS, used for artifact file names.
std::string CompactTimestamp(TimePoint tp);

} // namespace pbxpatch::util
