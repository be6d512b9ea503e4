#pragma once

#include <filesystem>
#include <ostream>

#include "internal/model/execution_plan.hpp"
#include "internal/pipeline/executor.hpp"
#include "internal/pipeline/function_discoverer.hpp"
#include "internal/runner/cancellation.hpp"
#include "internal/store/resource_store.hpp"

namespace fnpipe::core {

struct OrchestratorOptions {
  // Print the final ResourceList instead of writing the package.
  bool dry_run = false;
  // Empty disables results persistence.
  std::filesystem::path results_dir;
};

/*
  One run over one package:

      read -> discover -> execute -> write (or print) -> results

  The store is written only for committed runs. Results are persisted for
  committed and aborted runs alike, and before a failed package write is
  rethrown. Fatal errors propagate as exceptions.
*/
class Orchestrator {
 public:
  Orchestrator(store::ResourceStorePtr store, std::shared_ptr<pipeline::PipelineExecutor> executor, OrchestratorOptions options);

  pipeline::RunReport Run(const runner::CancellationToken& cancellation, std::ostream& dry_run_out);

  // Discovery only; nothing is executed or written.
  model::ExecutionPlan Plan();

 private:
  void PersistResults(const pipeline::RunReport& report) const;

  store::ResourceStorePtr                     store_;
  std::shared_ptr<pipeline::PipelineExecutor> executor_;
  pipeline::FunctionDiscoverer                discoverer_;
  OrchestratorOptions                         options_;
};

} // namespace fnpipe::core
