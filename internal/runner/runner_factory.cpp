#include "runner_factory.hpp"

#include "internal/runner/process_runner.hpp"

namespace fnpipe::runner {

FunctionRunnerPtr RunnerFactory::Build(const fnpipe::runtime::config::RunnerConfig& cfg) {
  ProcessRunnerOptions options;
  if (!cfg.container_engine().empty()) {
    options.container_engine = cfg.container_engine();
  }
  if (!cfg.user().empty()) {
    options.user = cfg.user();
  }
  options.allow_exec = cfg.allow_exec();
  options.network    = cfg.network();
  return std::make_shared<ProcessRunner>(std::move(options));
}

} // namespace fnpipe::runner
