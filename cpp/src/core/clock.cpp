#include "isidorcpp/clock.hpp"

#include <array>
#include <chrono>
#include <ctime>

namespace isidorcpp {

Timestamp SystemClock::Now() const {
  return std::chrono::system_clock::now();
}

std::shared_ptr<const Clock> SystemClock::Shared() {
  static const auto clock = std::make_shared<const SystemClock>();
  return clock;
}

std::string FormatUtcTimestamp(Timestamp timestamp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  std::array<char, 32> buffer{};
  const auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &utc);
  return std::string(buffer.data(), written);
}

}  // namespace isidorcpp
