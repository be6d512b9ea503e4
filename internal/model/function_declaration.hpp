#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/resource.hpp"

namespace fnpipe::model {

inline constexpr std::string_view kFunctionAnnotation       = "config.kubernetes.io/function";
inline constexpr std::string_view kLegacyFunctionAnnotation = "config.k8s.io/function";

struct ContainerMount {
  std::string type; // bind | volume | tmpfs
  std::string source;
  std::string target;
  bool        read_write = false;
};

struct ContainerRuntime {
  std::string                 image;
  std::optional<bool>         network;
  std::vector<std::string>    env;
  std::vector<ContainerMount> mounts;
};

struct ExecRuntime {
  std::string              path;
  std::vector<std::string> args;
};

// Closed set of runtime shapes a declaration can take.
using RuntimeSpec = std::variant<ContainerRuntime, ExecRuntime>;

/*
  Parsed form of a function declaration annotation.

  Built fresh by every discovery pass and never mutated afterwards. The
  declaring resource stays a normal member of the collection; a snapshot
  of it is kept here and handed to the function as functionConfig.
*/
struct FunctionDeclaration {
  RuntimeSpec runtime;
  bool        defer_failure = false;
  Resource    source;

  // Image for containers, path for exec.
  std::string Name() const;
};

// The declaration annotation value, preferring the current key over the legacy one.
std::optional<std::string> FindDeclarationAnnotation(const Resource& resource);

// Throws DeclarationParseError when the annotation is malformed.
FunctionDeclaration ParseDeclaration(const Resource& source, const std::string& annotation);

} // namespace fnpipe::model
