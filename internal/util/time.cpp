#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pbxpatch::util {

TimePoint Now() {
  return Clock::now();
}

std::string CompactTimestamp(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);

  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d_%H%M%S");
  return out.str();
}

} // namespace pbxpatch::util
