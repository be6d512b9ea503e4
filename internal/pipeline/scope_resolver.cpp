#include "scope_resolver.hpp"

#include "internal/util/errors.hpp"

namespace fnpipe::pipeline {

ScopeResolver::ScopeResolver(bool global_scope) : global_scope_(global_scope) {
}

void ScopeResolver::ValidateRelativePath(std::string_view path, std::string_view what) {
  if (path.empty()) {
    return;
  }
  if (path.front() == '/' || path.find('\\') != std::string_view::npos) {
    throw fnpipe::util::ScopeResolutionError(std::string(what) + " '" + std::string(path) + "' must be a relative slash separated path");
  }

  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end       = path.find('/', start);
    const auto component = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (component.empty() || component == "." || component == "..") {
      throw fnpipe::util::ScopeResolutionError(std::string(what) + " '" + std::string(path) + "' is not a normalized relative path");
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
}

bool ScopeResolver::Contains(std::string_view anchor, std::string_view directory) {
  if (anchor.empty()) {
    return true;
  }
  if (directory.size() < anchor.size() || directory.compare(0, anchor.size(), anchor) != 0) {
    return false;
  }
  return directory.size() == anchor.size() || directory[anchor.size()] == '/';
}

std::string ScopeResolver::AnchorFor(const model::Resource& declaring) {
  if (!declaring.provenance().HasPath()) {
    throw fnpipe::util::ScopeResolutionError("function declared on " + declaring.Identity().ToString() + " has no source path to anchor its scope");
  }
  ValidateRelativePath(declaring.provenance().path, "source path");
  return declaring.provenance().Directory();
}

ScopeSplit ScopeResolver::Resolve(const std::vector<model::Resource>& items, const std::string& anchor) const {
  ValidateRelativePath(anchor, "anchor");

  ScopeSplit split;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (global_scope_ || Contains(anchor, items[i].provenance().Directory())) {
      split.scoped.push_back(i);
    } else {
      split.complement.push_back(i);
    }
  }
  return split;
}

} // namespace fnpipe::pipeline
