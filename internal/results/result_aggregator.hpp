#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "internal/model/result.hpp"

namespace fnpipe::results {

/*
  Collects the ResultSet of every invocation and owns the final status.

  Result sets are kept in sequence order; repeated invocations of the same
  function stay separate entries told apart by sequence.

  FinalStatus() is 1 when any result has error severity, any invocation
  was deferred, or the run aborted; 0 otherwise.
*/
class ResultAggregator {
 public:
  void Record(model::ResultSet result_set);
  void MarkDeferred(std::size_t sequence);
  void MarkAborted();

  // Highest severity recorded, nullopt when there are no results at all.
  std::optional<model::Severity> OverallSeverity() const;
  int                            FinalStatus() const;

  const std::vector<model::ResultSet>& result_sets() const {
    return result_sets_;
  }

  // Every result of every set, in invocation order.
  std::vector<model::FunctionResult> Flatten() const;

  bool aborted() const {
    return aborted_;
  }
  const std::set<std::size_t>& deferred() const {
    return deferred_;
  }

 private:
  std::vector<model::ResultSet> result_sets_;
  std::set<std::size_t>         deferred_;
  bool                          aborted_ = false;
};

} // namespace fnpipe::results
