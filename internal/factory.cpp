#include "factory.hpp"

#include <vector>

#include "internal/runner/runner_factory.hpp"
#include "internal/store/local_package_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fnpipe::factory {

Application Build(const fnpipe::runtime::config::RuntimeConfig& config, const std::filesystem::path& package_root, bool dry_run) {
  if (package_root.empty()) {
    throw util::ConfigError("package directory is required");
  }

  Application app;

  const std::filesystem::path results_dir = config.pipeline().results_dir();

  std::vector<std::filesystem::path> excluded;
  if (!results_dir.empty()) {
    excluded.push_back(results_dir);
  }
  app.store = std::make_shared<store::LocalPackageStore>(package_root, std::move(excluded));

  app.runner = runner::RunnerFactory::Build(config.runner());

  pipeline::ExecutorOptions executor_options;
  executor_options.global_scope = config.pipeline().global_scope();
  executor_options.timeout      = util::ParseDuration(config.runner().timeout());
  executor_options.package_root = std::filesystem::absolute(package_root);
  app.executor = std::make_shared<pipeline::PipelineExecutor>(app.runner, std::move(executor_options));

  core::OrchestratorOptions orchestrator_options;
  orchestrator_options.dry_run     = dry_run;
  orchestrator_options.results_dir = results_dir;
  app.orchestrator = std::make_shared<core::Orchestrator>(app.store, app.executor, std::move(orchestrator_options));

  return app;
}

} // namespace fnpipe::factory
