#include <platform/time_utils.hpp>

#include <chrono>
#include <ctime>
#include <fmt/format.h>

namespace status_feed::platform {

namespace {

  auto to_local_tm(std::time_t time_value) -> std::tm
  {
    std::tm time_tm{};
#if defined(_WIN32)
    std::ignore = localtime_s(&time_tm, &time_value);
#else
    std::ignore = localtime_r(&time_value, &time_tm);
#endif
    return time_tm;
  }

}// namespace

auto current_unix_time() -> std::uint64_t
{
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

auto format_current_time_hms() -> std::string
{
  using namespace std::chrono;

  const std::time_t time_now = system_clock::to_time_t(system_clock::now());
  const auto time_tm = to_local_tm(time_now);

  return fmt::format("{:02d}:{:02d}:{:02d}", time_tm.tm_hour, time_tm.tm_min, time_tm.tm_sec);
}

auto format_unix_time(std::uint64_t unix_time) -> std::string
{
  const auto time_tm = to_local_tm(static_cast<std::time_t>(unix_time));

  static constexpr int tm_year_base = 1900;
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
    time_tm.tm_year + tm_year_base,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec);
}

}// namespace status_feed::platform
