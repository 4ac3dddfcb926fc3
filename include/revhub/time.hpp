#pragma once
#include <ctime>
#include <functional>
#include <string>

namespace revhub::timeutil {

// Source of "now" for commits, branches and pull requests. Tests inject a fixed clock.
using Clock = std::function<std::time_t()>;

// Wall clock (std::time).
auto system_clock() -> Clock;

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// "2024-04-29 17:45:45" in local time.
auto format_timestamp(std::time_t when) -> std::string;

} // namespace revhub::timeutil
