#pragma once

#include <optional>
#include <vector>

#include "internal/model/resource.hpp"
#include "internal/model/result.hpp"

namespace fnpipe::model {

/*
  The unit passed between pipeline stages: the resources, the optional
  functionConfig for one invocation, and the results produced so far.
  Item order carries provenance and diff meaning, not semantics.
*/
struct ResourceCollection {
  std::vector<Resource>   items;
  std::optional<Resource> function_config;
  std::vector<ResultSet>  results;

  ResourceCollection Clone() const;
};

} // namespace fnpipe::model
