#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/execution_plan.hpp"
#include "internal/model/resource_collection.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/pipeline/scope_resolver.hpp"
#include "internal/results/result_aggregator.hpp"
#include "internal/runner/function_runner.hpp"

namespace fnpipe::pipeline {

struct ExecutorOptions {
  bool                                      global_scope = false;
  std::optional<std::chrono::milliseconds>  timeout;
  std::filesystem::path                     package_root;
};

struct InvocationRecord {
  std::size_t            sequence = 0;
  std::string            name;
  std::string            anchor;
  model::InvocationState state     = model::InvocationState::kPending;
  int                    exit_code = 0;
  std::string            diagnostics;
  std::int64_t           duration_ms = 0;
};

struct RunReport {
  model::RunState state = model::RunState::kRunning;
  // Set only for committed runs; results are attached.
  std::optional<model::ResourceCollection> collection;
  std::vector<InvocationRecord>            invocations;
  results::ResultAggregator                results;
  bool                                     cancelled = false;
  std::string                              abort_reason;
};

/*
  Drives an execution plan to a terminal run state.

  Invocations run strictly one after another. Each sees the collection
  left by the previous one, restricted to its scope, and its response is
  installed only after the runner has returned.

  Failures:
    - without deferFailure the run aborts on the first failed invocation
      and the collection is discarded;
    - with deferFailure the invocation is Deferred, a parsable response is
      still merged, and execution continues;
    - cancellation aborts the run.

  Per-invocation errors never escape Execute. ScopeResolutionError does.
*/
class PipelineExecutor {
 public:
  PipelineExecutor(runner::FunctionRunnerPtr runner, ExecutorOptions options);

  RunReport Execute(model::ResourceCollection collection, const model::ExecutionPlan& plan,
                    const runner::CancellationToken& cancellation) const;

 private:
  runner::FunctionRunnerPtr runner_;
  ExecutorOptions           options_;
  ScopeResolver             scope_;
};

} // namespace fnpipe::pipeline
