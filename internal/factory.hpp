#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"

#include "internal/core/orchestrator.hpp"
#include "internal/pipeline/executor.hpp"
#include "internal/runner/function_runner.hpp"
#include "internal/store/resource_store.hpp"

namespace fnpipe::factory {

/*
  Application

  Owns everything one CLI invocation needs. Lives for the lifetime of the
  process.
*/
struct Application {
  store::ResourceStorePtr                     store;
  runner::FunctionRunnerPtr                   runner;
  std::shared_ptr<pipeline::PipelineExecutor> executor;
  std::shared_ptr<core::Orchestrator>         orchestrator;
};

/*
  Build

  Composition root. It is the only place that knows the concrete store
  and runner types. Throws ConfigError for invalid settings.
*/
Application Build(const fnpipe::runtime::config::RuntimeConfig& config, const std::filesystem::path& package_root, bool dry_run);

} // namespace fnpipe::factory
