#pragma once

#include <stdexcept>
#include <string>

namespace fnpipe::util {

/*
  Central error types.

  Fatal categories (declaration, scope, persistence, config, document)
  propagate to the CLI and abort the run. Per-invocation categories
  (runner, validation) are caught by the executor and turned into
  invocation state.
*/

class DeclarationParseError : public std::runtime_error {
 public:
  explicit DeclarationParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ScopeResolutionError : public std::runtime_error {
 public:
  explicit ScopeResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RunnerInvocationError : public std::runtime_error {
 public:
  explicit RunnerInvocationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DocumentParseError : public std::runtime_error {
 public:
  explicit DocumentParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fnpipe::util
