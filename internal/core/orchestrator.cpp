#include "orchestrator.hpp"

#include "internal/model/resource_list_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/results/results_writer.hpp"
#include "internal/util/errors.hpp"

namespace fnpipe::core {

using fnpipe::observability::IntField;
using fnpipe::observability::StringField;

Orchestrator::Orchestrator(store::ResourceStorePtr store, std::shared_ptr<pipeline::PipelineExecutor> executor, OrchestratorOptions options)
    : store_(std::move(store)), executor_(std::move(executor)), options_(std::move(options)) {
  if (!store_ || !executor_) {
    throw util::InvalidState("orchestrator requires a store and an executor");
  }
}

model::ExecutionPlan Orchestrator::Plan() {
  auto collection = store_->Read();
  auto plan       = discoverer_.Discover(collection);
  FNPIPE_LOG_INFO("plan built", {IntField("resources", static_cast<std::int64_t>(collection.items.size())),
                                 IntField("invocations", static_cast<std::int64_t>(plan.size()))});
  return plan;
}

pipeline::RunReport Orchestrator::Run(const runner::CancellationToken& cancellation, std::ostream& dry_run_out) {
  auto collection = store_->Read();
  auto plan       = discoverer_.Discover(collection);
  FNPIPE_LOG_INFO("plan built", {IntField("resources", static_cast<std::int64_t>(collection.items.size())),
                                 IntField("invocations", static_cast<std::int64_t>(plan.size()))});

  auto report = executor_->Execute(std::move(collection), plan, cancellation);

  if (report.state == model::RunState::kCommitted) {
    if (options_.dry_run) {
      dry_run_out << model::EmitResourceList(*report.collection);
      dry_run_out.flush();
    } else {
      try {
        store_->Write(*report.collection);
      } catch (const util::PersistenceError&) {
        // The results explain the run even when the package could not be written.
        PersistResults(report);
        throw;
      }
    }
  }

  PersistResults(report);
  return report;
}

void Orchestrator::PersistResults(const pipeline::RunReport& report) const {
  if (options_.results_dir.empty()) {
    return;
  }
  results::ResultsWriter(options_.results_dir).Write(report.results.result_sets());
  FNPIPE_LOG_INFO("results persisted", {StringField("dir", options_.results_dir.string()),
                                        IntField("result_sets", static_cast<std::int64_t>(report.results.result_sets().size()))});
}

} // namespace fnpipe::core
