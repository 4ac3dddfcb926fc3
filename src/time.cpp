#include "revhub/time.hpp"

#include "revhub/consts.hpp"

#include <array>
#include <cstdio>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
#endif

namespace {

std::tm local_tm(std::time_t t) {
  std::tm lt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
#else
  localtime_r(&t, &lt);
#endif
  return lt;
}

} // namespace

namespace revhub::timeutil {

auto system_clock() -> Clock {
  return [] { return std::time(nullptr); };
}

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt = local_tm(t);
  std::tm gt{};
#if defined(_WIN32)
  gmtime_s(&gt, &t);
#else
  gmtime_r(&t, &gt);
#endif
  // Convert both back to epoch and subtract: local - UTC
  const std::time_t local_epoch = std::mktime(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long diff = local_epoch - utc_epoch; // seconds
  return static_cast<int>(diff / 60);        // minutes
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, hh, mm);
  return std::string(buf);
}

std::string format_timestamp(std::time_t when) {
  const std::tm lt = local_tm(when);
  std::array<char, 32> buf{};
  const std::size_t n = std::strftime(buf.data(), buf.size(), consts::kTimestampFormat, &lt);
  return std::string(buf.data(), n);
}

} // namespace revhub::timeutil
