#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace fnpipe::runtime::config {
class RuntimeConfig;
}

namespace fnpipe::observability {

bool InitializeTracing(const fnpipe::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Span covering a pipeline run or one function invocation inside it.

  Invocation spans opened while a run span is alive become its children.
  Without ENABLE_OTEL every operation is a no-op.
*/
class PipelineSpan {
 public:
  static PipelineSpan ForRun(std::size_t planned_invocations);
  static PipelineSpan ForInvocation(std::size_t sequence, std::string_view function, std::string_view anchor);

  ~PipelineSpan();

  PipelineSpan(const PipelineSpan&)            = delete;
  PipelineSpan& operator=(const PipelineSpan&) = delete;

  PipelineSpan(PipelineSpan&&) noexcept;
  PipelineSpan& operator=(PipelineSpan&&) noexcept;

  void SetState(std::string_view state);
  void SetExitCode(int exit_code);
  void Fail(std::string_view reason);

 private:
  explicit PipelineSpan(std::string_view name);

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const fnpipe::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline PipelineSpan::PipelineSpan(std::string_view) {
}

inline PipelineSpan::~PipelineSpan() {
}

inline PipelineSpan::PipelineSpan(PipelineSpan&&) noexcept = default;

inline PipelineSpan& PipelineSpan::operator=(PipelineSpan&&) noexcept = default;

inline PipelineSpan PipelineSpan::ForRun(std::size_t) {
  return PipelineSpan("fnpipe.run");
}

inline PipelineSpan PipelineSpan::ForInvocation(std::size_t, std::string_view, std::string_view) {
  return PipelineSpan("fnpipe.invocation");
}

inline void PipelineSpan::SetState(std::string_view) {
}

inline void PipelineSpan::SetExitCode(int) {
}

inline void PipelineSpan::Fail(std::string_view) {
}

inline void PipelineSpan::SetAttribute(std::string_view, std::string_view) {
}

inline void PipelineSpan::SetAttribute(std::string_view, std::int64_t) {
}
#endif

} // namespace fnpipe::observability
