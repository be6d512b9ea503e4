#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runner/cancellation.hpp"
#include "internal/util/errors.hpp"

using fnpipe::observability::IntField;
using fnpipe::observability::StringField;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitFailed  = 1;
constexpr int kExitAborted = 2;
constexpr int kExitFatal   = 3;

fnpipe::runner::CancellationToken g_cancellation;

void HandleSignal(int) {
  g_cancellation.Cancel();
}

void Usage() {
  std::cerr << "Usage:\n"
            << "  fnpipe run <package-dir> [--config FILE] [--results-dir DIR] [--dry-run]\n"
            << "                           [--global-scope] [--timeout DUR] [--allow-exec]\n"
            << "  fnpipe plan <package-dir> [--config FILE]\n";
}

struct CliOptions {
  std::string                command;
  std::string                package_dir;
  std::string                config_path;
  std::optional<std::string> results_dir;
  std::optional<std::string> timeout;
  bool                       dry_run      = false;
  bool                       global_scope = false;
  bool                       allow_exec   = false;
};

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
  if (argc < 3) {
    return std::nullopt;
  }

  CliOptions options;
  options.command     = argv[1];
  options.package_dir = argv[2];
  if (options.command != "run" && options.command != "plan") {
    return std::nullopt;
  }

  for (int i = 3; i < argc; ++i) {
    const std::string arg      = argv[i];
    const bool        has_next = i + 1 < argc;
    if (arg == "--config" && has_next) {
      options.config_path = argv[++i];
    } else if (arg == "--results-dir" && has_next && options.command == "run") {
      options.results_dir = argv[++i];
    } else if (arg == "--timeout" && has_next && options.command == "run") {
      options.timeout = argv[++i];
    } else if (arg == "--dry-run" && options.command == "run") {
      options.dry_run = true;
    } else if (arg == "--global-scope") {
      options.global_scope = true;
    } else if (arg == "--allow-exec" && options.command == "run") {
      options.allow_exec = true;
    } else {
      std::cerr << "unknown or incomplete argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  return options;
}

fnpipe::runtime::config::RuntimeConfig LoadConfig(const CliOptions& options) {
  fnpipe::runtime::config::RuntimeConfig config;
  if (!options.config_path.empty()) {
    config = fnpipe::config::ConfigLoader::LoadFromYaml(options.config_path);
  }

  // Command line flags win over the file.
  if (options.results_dir) {
    config.mutable_pipeline()->set_results_dir(*options.results_dir);
  }
  if (options.timeout) {
    config.mutable_runner()->set_timeout(*options.timeout);
  }
  if (options.global_scope) {
    config.mutable_pipeline()->set_global_scope(true);
  }
  if (options.allow_exec) {
    config.mutable_runner()->set_allow_exec(true);
  }
  return config;
}

int RunPlan(const fnpipe::factory::Application& app) {
  const auto plan = app.orchestrator->Plan();
  for (const auto& invocation : plan.invocations()) {
    std::cout << invocation.sequence << ' ' << (invocation.anchor.empty() ? "." : invocation.anchor) << ' '
              << invocation.declaration.Name() << '\n';
  }
  return kExitOk;
}

int RunPipeline(const fnpipe::factory::Application& app) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  const auto report = app.orchestrator->Run(g_cancellation, std::cout);

  if (report.state == fnpipe::model::RunState::kAborted) {
    FNPIPE_LOG_ERROR("run aborted", {StringField("reason", report.abort_reason), fnpipe::observability::BoolField("cancelled", report.cancelled)});
    return kExitAborted;
  }

  const int status = report.results.FinalStatus();
  FNPIPE_LOG_INFO("run committed", {IntField("invocations", static_cast<std::int64_t>(report.invocations.size())),
                                    IntField("deferred", static_cast<std::int64_t>(report.results.deferred().size())),
                                    IntField("status", status)});
  return status == 0 ? kExitOk : kExitFailed;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    Usage();
    return kExitFatal;
  }

  // Until the config is known, log to stderr with defaults.
  try {
    fnpipe::observability::InitializeLogging(fnpipe::runtime::config::RuntimeConfig{});
  } catch (const fnpipe::util::ConfigError& e) {
    std::cerr << "fnpipe: " << e.what() << "\n";
    return kExitFatal;
  }

  int exit_code = kExitFatal;
  try {
    const auto config = LoadConfig(*options);

    fnpipe::observability::InitializeTracing(config);
    fnpipe::observability::InitializeLogging(config);

    const auto app = fnpipe::factory::Build(config, options->package_dir, options->dry_run);

    exit_code = options->command == "plan" ? RunPlan(app) : RunPipeline(app);
  } catch (const fnpipe::util::ConfigError& e) {
    FNPIPE_LOG_ERROR("invalid configuration", {StringField("error", e.what())});
  } catch (const fnpipe::util::DeclarationParseError& e) {
    FNPIPE_LOG_ERROR("function discovery failed", {StringField("error", e.what())});
  } catch (const fnpipe::util::ScopeResolutionError& e) {
    FNPIPE_LOG_ERROR("scope resolution failed", {StringField("error", e.what())});
  } catch (const fnpipe::util::DocumentParseError& e) {
    FNPIPE_LOG_ERROR("cannot read package", {StringField("error", e.what())});
  } catch (const fnpipe::util::PersistenceError& e) {
    FNPIPE_LOG_ERROR("cannot write package", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    FNPIPE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
  }

  fnpipe::observability::ShutdownTracing();
  fnpipe::observability::ShutdownLogging();
  return exit_code;
}
