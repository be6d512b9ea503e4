#include "result_aggregator.hpp"

#include <algorithm>

namespace fnpipe::results {

void ResultAggregator::Record(model::ResultSet result_set) {
  const auto position = std::upper_bound(result_sets_.begin(), result_sets_.end(), result_set.sequence,
                                         [](std::size_t sequence, const model::ResultSet& set) { return sequence < set.sequence; });
  result_sets_.insert(position, std::move(result_set));
}

void ResultAggregator::MarkDeferred(std::size_t sequence) {
  deferred_.insert(sequence);
}

void ResultAggregator::MarkAborted() {
  aborted_ = true;
}

std::optional<model::Severity> ResultAggregator::OverallSeverity() const {
  std::optional<model::Severity> overall;
  for (const auto& set : result_sets_) {
    for (const auto& result : set.items) {
      if (!overall || result.severity > *overall) {
        overall = result.severity;
      }
    }
  }
  return overall;
}

int ResultAggregator::FinalStatus() const {
  if (aborted_ || !deferred_.empty()) {
    return 1;
  }
  return OverallSeverity() == model::Severity::kError ? 1 : 0;
}

std::vector<model::FunctionResult> ResultAggregator::Flatten() const {
  std::vector<model::FunctionResult> flat;
  for (const auto& set : result_sets_) {
    flat.insert(flat.end(), set.items.begin(), set.items.end());
  }
  return flat;
}

} // namespace fnpipe::results
