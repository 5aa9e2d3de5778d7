#include "time.hpp"

#include <ctime>

namespace notewatch::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatTimestamp(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const auto size = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, size);
}

} // namespace notewatch::util
