#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/resource.hpp"

namespace fnpipe::pipeline {

// Positions into the collection the split was computed from, in collection order.
struct ScopeSplit {
  std::vector<std::size_t> scoped;
  std::vector<std::size_t> complement;
};

/*
  Decides which resources an invocation can see.

  A resource is in scope when its directory is the anchor or lies beneath
  it. Scoping is whole-resource; the complement passes through untouched.
  With global scope every resource is visible to every invocation.
*/
class ScopeResolver {
 public:
  explicit ScopeResolver(bool global_scope = false);

  // Throws ScopeResolutionError for an absolute or non-normalized anchor.
  ScopeSplit Resolve(const std::vector<model::Resource>& items, const std::string& anchor) const;

  // Directory of the declaring resource. Throws ScopeResolutionError when
  // the resource has no source path or the path is not a normalized
  // relative path.
  static std::string AnchorFor(const model::Resource& declaring);

  static bool Contains(std::string_view anchor, std::string_view directory);

  // Rejects absolute paths and empty, "." or ".." components.
  static void ValidateRelativePath(std::string_view path, std::string_view what);

 private:
  bool global_scope_;
};

} // namespace fnpipe::pipeline
