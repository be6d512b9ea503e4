#pragma once

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/resource.hpp"

namespace fnpipe::model {

// Ordinal: error > warn > info.
enum class Severity : std::uint8_t {
  kInfo  = 0,
  kWarn  = 1,
  kError = 2,
};

// Accepts "error", "warning", "warn" and "info".
std::optional<Severity> ParseSeverity(std::string_view text);
std::string_view        ToString(Severity severity);

struct FileLocation {
  std::string        path;
  std::optional<int> index;
};

struct FieldReference {
  std::string path;
  // Arbitrary YAML values; null when absent.
  YAML::Node current_value;
  YAML::Node suggested_value;
};

struct FunctionResult {
  Severity                           severity = Severity::kError;
  std::string                        message;
  std::map<std::string, std::string> tags;
  std::optional<ResourceIdentity>    resource_ref;
  std::optional<FileLocation>        file;
  std::optional<FieldReference>      field;
};

struct ResultSet {
  std::string                 name;
  std::size_t                 sequence  = 0;
  int                         exit_code = 0;
  std::vector<FunctionResult> items;
};

} // namespace fnpipe::model
