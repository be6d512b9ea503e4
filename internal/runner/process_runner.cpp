#include "process_runner.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <variant>

#include "internal/model/resource_list_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runner/subprocess.hpp"
#include "internal/util/errors.hpp"

namespace fnpipe::runner {

namespace {

using fnpipe::util::RunnerInvocationError;

std::string Resolve(const std::string& path, const std::filesystem::path& package_root) {
  std::filesystem::path p(path);
  if (p.is_relative() && !package_root.empty()) {
    p = package_root / p;
  }
  return p.lexically_normal().string();
}

std::string MountArgument(const model::ContainerMount& mount, const std::filesystem::path& package_root) {
  std::string arg = "type=" + mount.type;
  if (!mount.source.empty()) {
    const auto source = mount.type == "bind" ? Resolve(mount.source, package_root) : mount.source;
    arg += ",source=" + source;
  }
  arg += ",target=" + mount.target;
  if (!mount.read_write) {
    arg += ",readonly";
  }
  return arg;
}

} // namespace

ProcessRunner::ProcessRunner(ProcessRunnerOptions options) : options_(std::move(options)) {
}

std::vector<std::string> ProcessRunner::ContainerCommand(const model::ContainerRuntime& container,
                                                         const std::filesystem::path& package_root) const {
  const bool network = container.network.value_or(options_.network);

  std::vector<std::string> argv = {
      options_.container_engine,
      "run",
      "--rm",
      "-i",
      "--network",
      network ? "host" : "none",
      "--user",
      options_.user,
      "--security-opt=no-new-privileges",
  };
  for (const auto& env : container.env) {
    argv.push_back("-e");
    argv.push_back(env);
  }
  for (const auto& mount : container.mounts) {
    argv.push_back("--mount");
    argv.push_back(MountArgument(mount, package_root));
  }
  argv.push_back(container.image);
  return argv;
}

std::vector<std::string> ProcessRunner::ExecCommand(const model::ExecRuntime& exec, const std::filesystem::path& package_root) const {
  if (!options_.allow_exec) {
    throw RunnerInvocationError("exec function '" + exec.path + "' requires runner.allow_exec");
  }
  std::vector<std::string> argv;
  argv.reserve(exec.args.size() + 1);
  argv.push_back(exec.path.find('/') == std::string::npos ? exec.path : Resolve(exec.path, package_root));
  argv.insert(argv.end(), exec.args.begin(), exec.args.end());
  return argv;
}

std::vector<std::string> ProcessRunner::BuildCommand(const model::FunctionDeclaration& declaration,
                                                     const std::filesystem::path& package_root) const {
  if (const auto* container = std::get_if<model::ContainerRuntime>(&declaration.runtime)) {
    return ContainerCommand(*container, package_root);
  }
  return ExecCommand(std::get<model::ExecRuntime>(declaration.runtime), package_root);
}

RunOutcome ProcessRunner::Run(const model::FunctionDeclaration& declaration, const model::ResourceCollection& request,
                              const RunOptions& options) {
  ProcessSpec spec;
  spec.argv = BuildCommand(declaration, options.package_root);
  try {
    spec.stdin_data = model::EmitResourceList(request);
  } catch (const util::DocumentParseError& e) {
    throw RunnerInvocationError(std::string("cannot serialize request: ") + e.what());
  } catch (const YAML::Exception& e) {
    throw RunnerInvocationError(std::string("cannot serialize request: ") + e.what());
  }
  // Exec functions see package relative paths the way the package declares them.
  if (std::holds_alternative<model::ExecRuntime>(declaration.runtime) && !options.package_root.empty()) {
    spec.cwd = options.package_root.string();
  }
  spec.timeout      = options.timeout;
  spec.cancellation = options.cancellation;

  FNPIPE_LOG_DEBUG("spawning function", {observability::StringField("command", spec.argv.front()),
                                          observability::IntField("items", static_cast<std::int64_t>(request.items.size()))});

  auto process = RunProcess(spec);

  RunOutcome outcome;
  outcome.exit_code   = process.exit_code;
  outcome.diagnostics = std::move(process.stderr_text);
  outcome.timed_out   = process.timed_out;
  outcome.cancelled   = process.cancelled;
  if (outcome.timed_out || outcome.cancelled) {
    return outcome;
  }

  try {
    outcome.response = model::ParseResourceList(process.stdout_text);
  } catch (const util::DocumentParseError& e) {
    outcome.parse_failure = true;
    if (!outcome.diagnostics.empty() && outcome.diagnostics.back() != '\n') {
      outcome.diagnostics += '\n';
    }
    outcome.diagnostics += e.what();
  }
  return outcome;
}

} // namespace fnpipe::runner
