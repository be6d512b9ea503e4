#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/function_declaration.hpp"

namespace fnpipe::model {

/*
  A resolved unit of work.

  anchor is the directory of the declaring resource ("" for the package
  root); sequence is the position in the plan and tells repeated uses of
  the same function apart.
*/
struct FunctionInvocation {
  FunctionDeclaration declaration;
  std::string         anchor;
  std::size_t         sequence = 0;
};

// Fixed before execution starts; read-only afterwards.
class ExecutionPlan {
 public:
  ExecutionPlan() = default;
  explicit ExecutionPlan(std::vector<FunctionInvocation> invocations) : invocations_(std::move(invocations)) {
  }

  const std::vector<FunctionInvocation>& invocations() const {
    return invocations_;
  }

  std::size_t size() const {
    return invocations_.size();
  }

  bool empty() const {
    return invocations_.empty();
  }

 private:
  std::vector<FunctionInvocation> invocations_;
};

} // namespace fnpipe::model
