#pragma once

#include "internal/model/execution_plan.hpp"
#include "internal/model/resource_collection.hpp"

namespace fnpipe::pipeline {

/*
  Builds the execution plan from declaration annotations.

  Ordering:
    - nested directories run before their enclosing directory (post-order),
    - sibling directories run in lexical order,
    - within a directory, by file name then document index.

  Any malformed declaration aborts discovery; no partial plan is returned.
*/
class FunctionDiscoverer {
 public:
  model::ExecutionPlan Discover(const model::ResourceCollection& collection) const;

  static bool ExecutesBefore(const model::Provenance& lhs, const model::Provenance& rhs);
};

} // namespace fnpipe::pipeline
