#include "internal/pipeline/executor.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/core/orchestrator.hpp"
#include "internal/pipeline/function_discoverer.hpp"
#include "internal/runner/process_runner.hpp"
#include "internal/store/memory_resource_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using fnpipe::model::InvocationState;
using fnpipe::model::ResourceCollection;
using fnpipe::model::RunState;
using fnpipe::model::Severity;
using fnpipe::pipeline::ExecutorOptions;
using fnpipe::pipeline::FunctionDiscoverer;
using fnpipe::pipeline::PipelineExecutor;
using fnpipe::runner::CancellationToken;
using fnpipe::runner::RunOutcome;
using fnpipe::testing::ConfigMap;
using fnpipe::testing::FunctionResource;
using fnpipe::testing::Names;
using fnpipe::testing::ScriptedRunner;

ResourceCollection Package(bool defer_first = false) {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("fn1", "f1", "app/fn.yaml", 0, defer_first));
  collection.items.push_back(FunctionResource("fn2", "f2", "app/fn.yaml", 1));
  collection.items.push_back(ConfigMap("cm", "app/cm.yaml"));
  collection.items.push_back(ConfigMap("other", "other/x.yaml"));
  return collection;
}

fnpipe::pipeline::RunReport Execute(const std::shared_ptr<ScriptedRunner>& runner, const ResourceCollection& collection,
                                    const CancellationToken& cancellation = CancellationToken{}) {
  PipelineExecutor executor(runner, ExecutorOptions{});
  const auto       plan = FunctionDiscoverer().Discover(collection);
  return executor.Execute(collection.Clone(), plan, cancellation);
}

fnpipe::model::ResultSet Results(const std::string& name, std::vector<Severity> severities) {
  fnpipe::model::ResultSet set;
  set.name = name;
  for (auto severity : severities) {
    fnpipe::model::FunctionResult result;
    result.severity = severity;
    result.message  = std::string(fnpipe::model::ToString(severity)) + " finding";
    set.items.push_back(std::move(result));
  }
  return set;
}

RunOutcome Failing(const ResourceCollection& request, int exit_code) {
  auto outcome      = ScriptedRunner::Echo(request);
  outcome.exit_code = exit_code;
  outcome.response->results.push_back(Results("validator", {Severity::kError}));
  return outcome;
}

void TestResourcesOutsideTheScopeAreUntouched() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection& request) {
    auto outcome = ScriptedRunner::Echo(request);
    for (auto& item : outcome.response->items) {
      item.MutableDocument()["data"]["touched"] = "yes";
    }
    return outcome;
  });

  const auto input  = Package();
  const auto report = Execute(runner, input);

  assert(report.state == RunState::kCommitted);
  for (const auto& item : runner->calls[0].request.items) {
    assert(item.Identity().name != "other");
  }

  const auto& items = report.collection->items;
  assert(items.size() == input.items.size());
  assert(items[3].Identity().name == "other");
  assert(items[3].provenance() == input.items[3].provenance());
  assert(fnpipe::model::EmitDocument(items[3].Document()) == fnpipe::model::EmitDocument(input.items[3].Document()));
  assert(items[2].Document()["data"]["touched"].Scalar() == "yes");
}

void TestInvocationsChainInPlanOrder() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection& request) {
    auto outcome = ScriptedRunner::Echo(request);
    outcome.response->items.push_back(fnpipe::testing::MakeResource("apiVersion: v1\nkind: Secret\nmetadata:\n  name: added\n", ""));
    return outcome;
  });

  const auto report = Execute(runner, Package());

  assert(runner->calls.size() == 2);
  assert(runner->calls[0].name == "f1");
  assert(runner->calls[1].name == "f2");
  assert((Names(runner->calls[1].request.items) == std::vector<std::string>{"fn1", "fn2", "cm", "added"}));
  assert(runner->calls[1].request.items[3].provenance().path == "app/secret_added.yaml");

  // Each function receives its own declaring resource as functionConfig.
  assert(runner->calls[0].request.function_config->Identity().name == "fn1");
  assert(runner->calls[1].request.function_config->Identity().name == "fn2");

  assert(report.state == RunState::kCommitted);
  assert(report.invocations.size() == 2);
  assert(report.invocations[0].state == InvocationState::kSucceeded);
  assert(report.results.FinalStatus() == 0);
}

void TestFailureAbortsByDefault() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection& request) { return Failing(request, 1); });

  const auto report = Execute(runner, Package());

  assert(report.state == RunState::kAborted);
  assert(!report.collection);
  assert(runner->calls.size() == 1);
  assert(report.invocations.size() == 1);
  assert(report.invocations[0].state == InvocationState::kFailed);
  assert(report.results.result_sets().size() == 1);
  assert(report.results.aborted());
  assert(report.results.FinalStatus() != 0);
}

void TestDeferredFailureContinues() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection& request) {
    auto outcome = Failing(request, 2);
    outcome.response->items.pop_back();
    return outcome;
  });

  const auto report = Execute(runner, Package(true));

  assert(report.state == RunState::kCommitted);
  assert(runner->calls.size() == 2);
  assert(report.invocations[0].state == InvocationState::kDeferred);
  assert(report.invocations[1].state == InvocationState::kSucceeded);
  assert(report.results.result_sets().size() == 2);
  assert(report.results.deferred().count(0) == 1);
  assert(report.results.FinalStatus() != 0);

  // The partial output was merged: f1 dropped the last scoped resource.
  assert((Names(report.collection->items) == std::vector<std::string>{"fn1", "fn2", "other"}));
  assert(report.collection->results.size() == 2);
}

void TestDeferredUnparsableOutputKeepsInput() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection&) {
    RunOutcome outcome;
    outcome.exit_code     = 0;
    outcome.parse_failure = true;
    outcome.diagnostics   = "garbage on stdout";
    return outcome;
  });

  const auto input  = Package(true);
  const auto report = Execute(runner, input);

  assert(report.state == RunState::kCommitted);
  assert(report.invocations[0].state == InvocationState::kDeferred);
  assert(Names(report.collection->items) == Names(input.items));

  const auto& set = report.results.result_sets()[0];
  assert(set.items.size() == 1);
  assert(set.items[0].severity == Severity::kError);
}

void TestRunnerErrorsAreInvocationFailures() {
  class ThrowingRunner final : public fnpipe::runner::FunctionRunner {
   public:
    RunOutcome Run(const fnpipe::model::FunctionDeclaration&, const ResourceCollection&, const fnpipe::runner::RunOptions&) override {
      throw fnpipe::util::RunnerInvocationError("image not found");
    }
  };

  PipelineExecutor executor(std::make_shared<ThrowingRunner>(), ExecutorOptions{});
  const auto       input  = Package();
  const auto       report = executor.Execute(input.Clone(), FunctionDiscoverer().Discover(input), CancellationToken{});

  assert(report.state == RunState::kAborted);
  assert(report.invocations[0].state == InvocationState::kFailed);
  assert(report.invocations[0].diagnostics.find("image not found") != std::string::npos);
  assert(report.results.result_sets()[0].items[0].message == "image not found");
}

void TestWarningsAloneDoNotFailTheRun() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [](const ResourceCollection& request) {
    auto outcome = ScriptedRunner::Echo(request);
    outcome.response->results.push_back(Results("lint", {Severity::kWarn, Severity::kInfo}));
    return outcome;
  });

  auto report = Execute(runner, Package());
  assert(report.state == RunState::kCommitted);
  assert(report.results.OverallSeverity() == Severity::kWarn);
  assert(report.results.FinalStatus() == 0);

  runner->On("f2", [](const ResourceCollection& request) {
    auto outcome = ScriptedRunner::Echo(request);
    outcome.response->results.push_back(Results("lint", {Severity::kError}));
    return outcome;
  });

  report = Execute(runner, Package());
  assert(report.state == RunState::kCommitted);
  assert(report.results.OverallSeverity() == Severity::kError);
  assert(report.results.FinalStatus() != 0);
}

void TestCancellationAbortsTheRun() {
  CancellationToken cancellation;
  auto              runner = std::make_shared<ScriptedRunner>();
  runner->On("f1", [&cancellation](const ResourceCollection& request) {
    cancellation.Cancel();
    auto outcome      = ScriptedRunner::Echo(request);
    outcome.cancelled = true;
    return outcome;
  });

  const auto report = Execute(runner, Package(true), cancellation);

  assert(report.state == RunState::kAborted);
  assert(report.cancelled);
  assert(runner->calls.size() == 1);
  assert(!report.collection);
}

void TestOrchestratorWritesOnlyCommittedRuns() {
  auto runner = std::make_shared<ScriptedRunner>();
  auto store  = std::make_shared<fnpipe::store::MemoryResourceStore>(Package());
  auto executor = std::make_shared<PipelineExecutor>(runner, ExecutorOptions{});

  std::ostringstream   out;
  CancellationToken    cancellation;
  fnpipe::core::Orchestrator committed(store, executor, fnpipe::core::OrchestratorOptions{});
  assert(committed.Run(cancellation, out).state == RunState::kCommitted);
  assert(store->write_count() == 1);
  assert(out.str().empty());

  runner->On("f2", [](const ResourceCollection& request) { return Failing(request, 1); });
  assert(committed.Run(cancellation, out).state == RunState::kAborted);
  assert(store->write_count() == 1);
}

void TestDryRunPrintsInsteadOfWriting() {
  auto runner   = std::make_shared<ScriptedRunner>();
  auto store    = std::make_shared<fnpipe::store::MemoryResourceStore>(Package());
  auto executor = std::make_shared<PipelineExecutor>(runner, ExecutorOptions{});

  fnpipe::core::OrchestratorOptions options;
  options.dry_run = true;
  fnpipe::core::Orchestrator orchestrator(store, executor, options);

  std::ostringstream out;
  assert(orchestrator.Run(CancellationToken{}, out).state == RunState::kCommitted);
  assert(store->write_count() == 0);

  const auto printed = fnpipe::model::ParseResourceList(out.str());
  assert(printed.items.size() == 4);
  assert(printed.items[3].provenance().path == "other/x.yaml");
  assert(printed.results.size() == 2);

  const auto plan = orchestrator.Plan();
  assert(plan.size() == 2);
}

void TestUnserializableScopeIsADeferredFailure() {
  YAML::Node declaring;
  declaring["apiVersion"]       = "fn.example.com/v1";
  declaring["kind"]             = "Function";
  declaring["metadata"]["name"] = "echo";
  declaring["metadata"]["annotations"][std::string(fnpipe::model::kFunctionAnnotation)] =
      "exec:\n  path: /bin/cat\ndeferFailure: true\n";

  ResourceCollection input;
  input.items.emplace_back(declaring, fnpipe::model::Provenance{"app/fn.yaml", 0});
  input.items.push_back(
      fnpipe::testing::MakeResource("apiVersion: v1\nkind: ConfigMap\nmetadata:\n  name: bad\n  annotations: oops\n", "app/bad.yaml"));
  input.items.push_back(ConfigMap("other", "other/x.yaml"));

  fnpipe::runner::ProcessRunnerOptions runner_options;
  runner_options.allow_exec = true;
  PipelineExecutor executor(std::make_shared<fnpipe::runner::ProcessRunner>(runner_options), ExecutorOptions{});

  const auto report = executor.Execute(input.Clone(), FunctionDiscoverer().Discover(input), CancellationToken{});

  assert(report.state == RunState::kCommitted);
  assert(report.invocations.size() == 1);
  assert(report.invocations[0].state == InvocationState::kDeferred);
  assert(Names(report.collection->items) == Names(input.items));
  assert(report.results.result_sets().size() == 1);
  assert(report.results.result_sets()[0].items[0].severity == Severity::kError);
  assert(report.results.FinalStatus() != 0);
}

void TestResultsSurviveAFailedPackageWrite() {
  class UnwritableStore final : public fnpipe::store::ResourceStore {
   public:
    ResourceCollection Read() override {
      return Package();
    }
    void Write(const ResourceCollection&) override {
      throw fnpipe::util::PersistenceError("disk full");
    }
  };

  const auto results_dir = fnpipe::testing::FreshDirectory("executor_unwritable_results");

  fnpipe::core::OrchestratorOptions options;
  options.results_dir = results_dir;
  fnpipe::core::Orchestrator orchestrator(std::make_shared<UnwritableStore>(),
                                          std::make_shared<PipelineExecutor>(std::make_shared<ScriptedRunner>(), ExecutorOptions{}), options);

  std::ostringstream out;
  bool               threw = false;
  try {
    (void)orchestrator.Run(CancellationToken{}, out);
  } catch (const fnpipe::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
  assert(std::filesystem::exists(results_dir / "results-0.yaml"));
  assert(std::filesystem::exists(results_dir / "results-1.yaml"));
}

} // namespace

int main() {
  TestResourcesOutsideTheScopeAreUntouched();
  TestInvocationsChainInPlanOrder();
  TestFailureAbortsByDefault();
  TestDeferredFailureContinues();
  TestDeferredUnparsableOutputKeepsInput();
  TestRunnerErrorsAreInvocationFailures();
  TestWarningsAloneDoNotFailTheRun();
  TestCancellationAbortsTheRun();
  TestOrchestratorWritesOnlyCommittedRuns();
  TestDryRunPrintsInsteadOfWriting();
  TestUnserializableScopeIsADeferredFailure();
  TestResultsSurviveAFailedPackageWrite();

  std::cout << "fnpipe_unit_executor: pass\n";
  return 0;
}
