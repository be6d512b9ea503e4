#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fnpipe::util {

/*
  Time utilities. Steady clock for measuring invocations.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ElapsedMillis(TimePoint since);

// Parses "<integer><unit>" with unit ms|s|m|h. Empty input yields nullopt.
// Throws ConfigError on anything else.
std::optional<std::chrono::milliseconds> ParseDuration(std::string_view text);

} // namespace fnpipe::util
