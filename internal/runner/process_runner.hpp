#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/runner/function_runner.hpp"

namespace fnpipe::runner {

struct ProcessRunnerOptions {
  std::string container_engine = "docker";
  bool        allow_exec       = false;
  // Default for declarations that do not say.
  bool        network = false;
  std::string user    = "nobody";
};

/*
  Runs containers through the configured engine CLI and exec functions
  directly. The request travels on stdin and the response on stdout, both
  as a ResourceList.
*/
class ProcessRunner final : public FunctionRunner {
 public:
  explicit ProcessRunner(ProcessRunnerOptions options);

  RunOutcome Run(const model::FunctionDeclaration& declaration, const model::ResourceCollection& request,
                 const RunOptions& options) override;

  // Throws RunnerInvocationError for exec functions when exec is disabled.
  std::vector<std::string> BuildCommand(const model::FunctionDeclaration& declaration,
                                        const std::filesystem::path& package_root) const;

 private:
  std::vector<std::string> ContainerCommand(const model::ContainerRuntime& container,
                                            const std::filesystem::path& package_root) const;
  std::vector<std::string> ExecCommand(const model::ExecRuntime& exec, const std::filesystem::path& package_root) const;

  ProcessRunnerOptions options_;
};

} // namespace fnpipe::runner
