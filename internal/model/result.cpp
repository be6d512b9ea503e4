#include "result.hpp"

namespace fnpipe::model {

std::optional<Severity> ParseSeverity(std::string_view text) {
  if (text == "error") {
    return Severity::kError;
  }
  if (text == "warning" || text == "warn") {
    return Severity::kWarn;
  }
  if (text == "info") {
    return Severity::kInfo;
  }
  return std::nullopt;
}

std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kError:
      return "error";
    case Severity::kWarn:
      return "warning";
    case Severity::kInfo:
      return "info";
  }
  return "error";
}

} // namespace fnpipe::model
