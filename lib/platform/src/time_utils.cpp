#include <platform/time_utils.hpp>

#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <limits>

namespace nostr_pool::platform {

auto unix_now() -> std::uint64_t
{
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

auto format_utc(std::uint64_t unix_seconds) -> std::string
{
  if (unix_seconds > static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max())) {
    return fmt::format("{}", unix_seconds);
  }

  const auto time_value = static_cast<std::time_t>(unix_seconds);
  std::tm time_tm{};
#if defined(_WIN32)
  if (gmtime_s(&time_tm, &time_value) != 0) { return fmt::format("{}", unix_seconds); }
#else
  if (gmtime_r(&time_value, &time_tm) == nullptr) { return fmt::format("{}", unix_seconds); }
#endif

  constexpr int tm_base_year = 1900;
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
    time_tm.tm_year + tm_base_year,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec);
}

}// namespace nostr_pool::platform
