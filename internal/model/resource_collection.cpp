#include "resource_collection.hpp"

namespace fnpipe::model {

ResourceCollection ResourceCollection::Clone() const {
  ResourceCollection copy;
  copy.items.reserve(items.size());
  for (const auto& item : items) {
    copy.items.push_back(item.Clone());
  }
  if (function_config) {
    copy.function_config = function_config->Clone();
  }
  copy.results = results;
  for (auto& result_set : copy.results) {
    for (auto& result : result_set.items) {
      if (result.field) {
        result.field->current_value   = YAML::Clone(result.field->current_value);
        result.field->suggested_value = YAML::Clone(result.field->suggested_value);
      }
    }
  }
  return copy;
}

} // namespace fnpipe::model
