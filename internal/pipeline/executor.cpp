#include "executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/reconciler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fnpipe::pipeline {

namespace {

using fnpipe::model::InvocationState;
using fnpipe::observability::IntField;
using fnpipe::observability::StringField;

void Transition(InvocationRecord& record, InvocationState next) {
  if (!model::CanTransition(record.state, next)) {
    throw util::InvalidState("invocation " + std::to_string(record.sequence) + " cannot move from " +
                             std::string(model::ToString(record.state)) + " to " + std::string(model::ToString(next)));
  }
  record.state = next;
}

void Transition(RunReport& report, model::RunState next) {
  if (!model::CanTransition(report.state, next)) {
    throw util::InvalidState("run cannot move from " + std::string(model::ToString(report.state)) + " to " +
                             std::string(model::ToString(next)));
  }
  report.state = next;
}

model::ResourceCollection BuildRequest(const model::ResourceCollection& current, const ScopeSplit& split,
                                       const model::FunctionDeclaration& declaration) {
  model::ResourceCollection request;
  request.items.reserve(split.scoped.size());
  for (auto index : split.scoped) {
    request.items.push_back(current.items[index].Clone());
  }
  request.function_config = declaration.source.Clone();
  return request;
}

// Throws RunnerInvocationError or ValidationFailure when the outcome does
// not count as success.
void CheckOutcome(const runner::RunOutcome& outcome, const ExecutorOptions& options) {
  if (outcome.timed_out) {
    throw util::RunnerInvocationError("timed out after " + std::to_string(options.timeout ? options.timeout->count() : 0) + "ms");
  }
  if (outcome.parse_failure || !outcome.response) {
    throw util::RunnerInvocationError("output is not a valid ResourceList (exit code " + std::to_string(outcome.exit_code) + ")");
  }
  if (outcome.exit_code != 0) {
    throw util::ValidationFailure("exited with code " + std::to_string(outcome.exit_code));
  }
}

bool HasError(const model::ResultSet& result_set) {
  for (const auto& result : result_set.items) {
    if (result.severity == model::Severity::kError) {
      return true;
    }
  }
  return false;
}

model::ResultSet BuildResultSet(const model::FunctionInvocation& invocation, const std::optional<runner::RunOutcome>& outcome,
                                const std::optional<std::string>& failure) {
  model::ResultSet result_set;
  result_set.name      = invocation.declaration.Name();
  result_set.sequence  = invocation.sequence;
  result_set.exit_code = outcome ? outcome->exit_code : -1;

  if (outcome && outcome->response) {
    for (const auto& reported : outcome->response->results) {
      result_set.items.insert(result_set.items.end(), reported.items.begin(), reported.items.end());
    }
  }

  // A failure must be visible in the results even when the function
  // reported nothing itself.
  if (failure && !HasError(result_set)) {
    model::FunctionResult result;
    result.severity = model::Severity::kError;
    result.message  = *failure;
    if (outcome && !outcome->diagnostics.empty()) {
      result.tags["stderr"] = outcome->diagnostics;
    }
    result_set.items.push_back(std::move(result));
  }
  return result_set;
}

} // namespace

PipelineExecutor::PipelineExecutor(runner::FunctionRunnerPtr runner, ExecutorOptions options)
    : runner_(std::move(runner)), options_(std::move(options)), scope_(options_.global_scope) {
  if (!runner_) {
    throw util::InvalidState("pipeline executor requires a function runner");
  }
}

RunReport PipelineExecutor::Execute(model::ResourceCollection collection, const model::ExecutionPlan& plan,
                                    const runner::CancellationToken& cancellation) const {
  auto run_span = observability::PipelineSpan::ForRun(plan.size());

  RunReport report;
  collection.function_config.reset();
  collection.results.clear();

  auto abort_run = [&](std::string reason) {
    FNPIPE_LOG_ERROR("run aborted", {StringField("reason", reason)});
    run_span.Fail(reason);
    report.results.MarkAborted();
    report.abort_reason = std::move(reason);
    Transition(report, model::RunState::kAborted);
  };

  for (const auto& invocation : plan.invocations()) {
    if (cancellation.IsCancelled()) {
      report.cancelled = true;
      abort_run("cancelled before invocation " + std::to_string(invocation.sequence));
      break;
    }

    const auto& declaration = invocation.declaration;

    InvocationRecord record;
    record.sequence = invocation.sequence;
    record.name     = declaration.Name();
    record.anchor   = invocation.anchor;

    auto span = observability::PipelineSpan::ForInvocation(record.sequence, record.name, record.anchor);

    const auto started = util::Now();
    Transition(record, InvocationState::kRunning);
    FNPIPE_LOG_INFO("function started", {IntField("seq", static_cast<std::int64_t>(record.sequence)), StringField("function", record.name),
                                         StringField("anchor", record.anchor)});

    const auto split   = scope_.Resolve(collection.items, invocation.anchor);
    auto       request = BuildRequest(collection, split, declaration);

    runner::RunOptions run_options;
    run_options.timeout      = options_.timeout;
    run_options.cancellation = &cancellation;
    run_options.package_root = options_.package_root;

    std::optional<runner::RunOutcome> outcome;
    std::optional<std::string>        failure;
    try {
      outcome = runner_->Run(declaration, request, run_options);
      if (!outcome->cancelled && !cancellation.IsCancelled()) {
        CheckOutcome(*outcome, options_);
      }
    } catch (const util::RunnerInvocationError& e) {
      failure = e.what();
    } catch (const util::ValidationFailure& e) {
      failure = e.what();
    }

    const bool cancelled = outcome && (outcome->cancelled || cancellation.IsCancelled());

    record.exit_code = outcome ? outcome->exit_code : -1;
    if (outcome) {
      record.diagnostics = outcome->diagnostics;
    }
    if (failure) {
      span.Fail(*failure);
      record.diagnostics += record.diagnostics.empty() ? *failure : "\n" + *failure;
    }

    if (cancelled) {
      Transition(record, InvocationState::kFailed);
    } else {
      report.results.Record(BuildResultSet(invocation, outcome, failure));

      const bool mergeable = outcome && outcome->response.has_value();
      if (!failure) {
        collection.items = Reconcile(collection.items, split, std::move(outcome->response->items), invocation.anchor);
        Transition(record, InvocationState::kSucceeded);
      } else if (declaration.defer_failure) {
        if (mergeable) {
          collection.items = Reconcile(collection.items, split, std::move(outcome->response->items), invocation.anchor);
        }
        report.results.MarkDeferred(invocation.sequence);
        Transition(record, InvocationState::kDeferred);
      } else {
        Transition(record, InvocationState::kFailed);
      }
    }

    record.duration_ms = util::ElapsedMillis(started);
    span.SetState(model::ToString(record.state));
    span.SetExitCode(record.exit_code);

    const std::initializer_list<observability::LogField> fields = {
        IntField("seq", static_cast<std::int64_t>(record.sequence)), StringField("function", record.name),
        StringField("state", model::ToString(record.state)),         IntField("exit_code", record.exit_code),
        IntField("duration_ms", record.duration_ms),
    };
    if (record.state == InvocationState::kSucceeded) {
      FNPIPE_LOG_INFO("function completed", fields);
    } else {
      FNPIPE_LOG_WARN("function completed", fields);
      if (!record.diagnostics.empty()) {
        FNPIPE_LOG_DEBUG("function diagnostics", {IntField("seq", static_cast<std::int64_t>(record.sequence)),
                                                  StringField("stderr", record.diagnostics)});
      }
    }

    report.invocations.push_back(std::move(record));
    const auto& finished = report.invocations.back();

    if (cancelled) {
      report.cancelled = true;
      abort_run("cancelled during invocation " + std::to_string(finished.sequence));
      break;
    }
    if (finished.state == InvocationState::kFailed) {
      abort_run("function " + finished.name + " (seq " + std::to_string(finished.sequence) + ") failed: " + *failure);
      break;
    }
  }

  if (report.state == model::RunState::kRunning) {
    Transition(report, model::RunState::kCommitted);
    collection.results  = report.results.result_sets();
    report.collection   = std::move(collection);
  }

  run_span.SetState(model::ToString(report.state));
  FNPIPE_LOG_INFO("run finished", {StringField("state", model::ToString(report.state)),
                                   IntField("invocations", static_cast<std::int64_t>(report.invocations.size())),
                                   IntField("status", report.results.FinalStatus())});
  return report;
}

} // namespace fnpipe::pipeline
