#pragma once

#include "config/config.pb.h"
#include "internal/runner/function_runner.hpp"

namespace fnpipe::runner {

/*
  Builds the function runner from configuration.

      auto runner = RunnerFactory::Build(config.runner());
      runner->Run(declaration, request, options);
*/
class RunnerFactory {
 public:
  static FunctionRunnerPtr Build(const fnpipe::runtime::config::RunnerConfig& cfg);
};

} // namespace fnpipe::runner
