#include "mseq/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mseq::core {

std::string format_iso8601_utc(const std::chrono::system_clock::time_point time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string SystemClock::now_iso8601() {
  return format_iso8601_utc(std::chrono::system_clock::now());
}

}  // namespace mseq::core
