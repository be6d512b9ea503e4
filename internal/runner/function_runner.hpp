#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/function_declaration.hpp"
#include "internal/model/resource_collection.hpp"
#include "internal/runner/cancellation.hpp"

namespace fnpipe::runner {

struct RunOptions {
  std::optional<std::chrono::milliseconds> timeout;
  const CancellationToken*                  cancellation = nullptr;
  // Relative exec paths and bind mount sources resolve against this.
  std::filesystem::path package_root;
};

/*
  What one function call produced.

  response is empty when the process was killed or its stdout could not be
  parsed; parse_failure tells the two apart. diagnostics carries stderr.
*/
struct RunOutcome {
  std::optional<model::ResourceCollection> response;
  bool                                     parse_failure = false;
  int                                      exit_code     = 0;
  std::string                              diagnostics;
  bool                                     timed_out = false;
  bool                                     cancelled = false;
};

/*
  Executes one invocation out of process.

  Implementations receive a disposable request and must not keep any
  reference to it after Run returns. Throws RunnerInvocationError when the
  runtime cannot be started at all.
*/
class FunctionRunner {
 public:
  virtual ~FunctionRunner() = default;

  virtual RunOutcome Run(const model::FunctionDeclaration& declaration, const model::ResourceCollection& request,
                         const RunOptions& options) = 0;
};

using FunctionRunnerPtr = std::shared_ptr<FunctionRunner>;

} // namespace fnpipe::runner
