#pragma once

#include <string>
#include <vector>

#include "internal/model/resource.hpp"
#include "internal/pipeline/scope_resolver.hpp"

namespace fnpipe::pipeline {

/*
  Installs a function's output in place of the scoped subset.

  - Response items sharing an identity collapse into one; a later copy
    without a path (or with the same path) replaces the earlier one.
  - Each scoped resource is replaced, at its position, by the first
    unconsumed response item with the same identity and a compatible path.
  - Scoped resources without a match are deleted.
  - Remaining response items are appended; items without a path default to
    <anchor>/<kind>_<name>.yaml.
  - Complement resources are copied through untouched.
*/
std::vector<model::Resource> Reconcile(const std::vector<model::Resource>& current, const ScopeSplit& split,
                                       std::vector<model::Resource> response, const std::string& anchor);

// Default file for a resource created by a function anchored at anchor.
std::string DefaultPathFor(const model::ResourceIdentity& identity, const std::string& anchor);

} // namespace fnpipe::pipeline
