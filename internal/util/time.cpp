#include "time.hpp"

#include <cctype>
#include <string>

#include "internal/util/errors.hpp"

namespace fnpipe::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ElapsedMillis(TimePoint since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

std::optional<std::chrono::milliseconds> ParseDuration(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits > 12) {
    throw ConfigError("invalid duration '" + std::string(text) + "': expected <integer><unit>");
  }

  const auto value = std::stoll(std::string(text.substr(0, digits)));
  const auto unit  = text.substr(digits);

  if (unit == "ms") {
    return std::chrono::milliseconds(value);
  }
  if (unit == "s") {
    return std::chrono::seconds(value);
  }
  if (unit == "m") {
    return std::chrono::minutes(value);
  }
  if (unit == "h") {
    return std::chrono::hours(value);
  }

  throw ConfigError("invalid duration '" + std::string(text) + "': unit must be one of ms, s, m, h");
}

} // namespace fnpipe::util
