#include "function_discoverer.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/scope_resolver.hpp"

namespace fnpipe::pipeline {

namespace {

std::vector<std::string_view> SplitComponents(std::string_view directory) {
  std::vector<std::string_view> components;
  std::size_t                   start = 0;
  while (!directory.empty() && start <= directory.size()) {
    const auto end = directory.find('/', start);
    if (end == std::string_view::npos) {
      components.push_back(directory.substr(start));
      break;
    }
    components.push_back(directory.substr(start, end - start));
    start = end + 1;
  }
  return components;
}

std::string_view FileName(std::string_view path) {
  const auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

bool FunctionDiscoverer::ExecutesBefore(const model::Provenance& lhs, const model::Provenance& rhs) {
  const auto lhs_dir = lhs.Directory();
  const auto rhs_dir = rhs.Directory();
  const auto lhs_components = SplitComponents(lhs_dir);
  const auto rhs_components = SplitComponents(rhs_dir);

  std::size_t i = 0;
  while (i < lhs_components.size() && i < rhs_components.size() && lhs_components[i] == rhs_components[i]) {
    ++i;
  }

  const bool lhs_exhausted = i == lhs_components.size();
  const bool rhs_exhausted = i == rhs_components.size();

  if (lhs_exhausted && rhs_exhausted) {
    const auto lhs_file = FileName(lhs.path);
    const auto rhs_file = FileName(rhs.path);
    if (lhs_file != rhs_file) {
      return lhs_file < rhs_file;
    }
    return lhs.index < rhs.index;
  }

  // An enclosing directory runs after everything beneath it.
  if (lhs_exhausted) {
    return false;
  }
  if (rhs_exhausted) {
    return true;
  }

  return lhs_components[i] < rhs_components[i];
}

model::ExecutionPlan FunctionDiscoverer::Discover(const model::ResourceCollection& collection) const {
  struct Candidate {
    model::FunctionDeclaration declaration;
    std::string                anchor;
  };

  std::vector<Candidate> candidates;
  for (const auto& resource : collection.items) {
    auto annotation = model::FindDeclarationAnnotation(resource);
    if (!annotation) {
      continue;
    }

    auto declaration = model::ParseDeclaration(resource, *annotation);
    auto anchor      = ScopeResolver::AnchorFor(resource);
    candidates.push_back(Candidate{std::move(declaration), std::move(anchor)});
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& lhs, const Candidate& rhs) {
    return ExecutesBefore(lhs.declaration.source.provenance(), rhs.declaration.source.provenance());
  });

  std::vector<model::FunctionInvocation> invocations;
  invocations.reserve(candidates.size());
  for (auto& candidate : candidates) {
    const auto sequence = invocations.size();
    FNPIPE_LOG_DEBUG("function discovered", {observability::IntField("seq", static_cast<std::int64_t>(sequence)),
                                             observability::StringField("function", candidate.declaration.Name()),
                                             observability::StringField("anchor", candidate.anchor)});
    invocations.push_back(model::FunctionInvocation{std::move(candidate.declaration), std::move(candidate.anchor), sequence});
  }

  return model::ExecutionPlan(std::move(invocations));
}

} // namespace fnpipe::pipeline
