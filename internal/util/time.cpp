#include "time.hpp"

#include <ctime>

namespace sitepull::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  auto millis = std::chrono::seconds(duration.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(duration.nanos()));
  if (millis.count() <= 0) {
    return fallback;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(millis);
}

std::string FormatCompactUtc(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &utc);
  return buffer;
}

std::string FormatIsoUtc(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

} // namespace sitepull::util
