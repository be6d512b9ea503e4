#include "reconciler.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace fnpipe::pipeline {

namespace {

std::string IdentityKey(const model::ResourceIdentity& id) {
  std::string key;
  key.reserve(id.api_version.size() + id.kind.size() + id.namespace_.size() + id.name.size() + 3);
  key.append(id.api_version).push_back('\0');
  key.append(id.kind).push_back('\0');
  key.append(id.namespace_).push_back('\0');
  key.append(id.name);
  return key;
}

bool PathCompatible(const model::Resource& candidate, const model::Resource& existing) {
  return !candidate.provenance().HasPath() || candidate.provenance().path == existing.provenance().path;
}

std::vector<model::Resource> CollapseDuplicates(std::vector<model::Resource> response) {
  std::vector<model::Resource>                                  collapsed;
  std::unordered_map<std::string, std::vector<std::size_t>> by_identity;

  collapsed.reserve(response.size());
  for (auto& item : response) {
    auto& slots = by_identity[IdentityKey(item.Identity())];

    auto match = std::find_if(slots.begin(), slots.end(), [&](std::size_t slot) { return PathCompatible(item, collapsed[slot]); });
    if (match == slots.end()) {
      slots.push_back(collapsed.size());
      collapsed.push_back(std::move(item));
      continue;
    }

    auto& existing = collapsed[*match];
    if (!item.provenance().HasPath()) {
      item.set_provenance(existing.provenance());
    }
    existing = std::move(item);
  }
  return collapsed;
}

} // namespace

std::string DefaultPathFor(const model::ResourceIdentity& identity, const std::string& anchor) {
  std::string file = identity.name.empty() ? identity.kind : identity.kind + "_" + identity.name;
  if (file.empty()) {
    file = "resource";
  }
  for (auto& c : file) {
    c = c == '/' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  file += ".yaml";
  return anchor.empty() ? file : anchor + "/" + file;
}

std::vector<model::Resource> Reconcile(const std::vector<model::Resource>& current, const ScopeSplit& split,
                                       std::vector<model::Resource> response, const std::string& anchor) {
  auto collapsed = CollapseDuplicates(std::move(response));

  std::vector<bool> in_scope(current.size(), false);
  for (auto index : split.scoped) {
    in_scope.at(index) = true;
  }

  std::unordered_map<std::string, std::vector<std::size_t>> by_identity;
  for (std::size_t i = 0; i < collapsed.size(); ++i) {
    by_identity[IdentityKey(collapsed[i].Identity())].push_back(i);
  }

  std::vector<bool>            consumed(collapsed.size(), false);
  std::vector<model::Resource> merged;
  merged.reserve(current.size() + collapsed.size());

  for (std::size_t i = 0; i < current.size(); ++i) {
    const auto& original = current[i];
    if (!in_scope[i]) {
      merged.push_back(original);
      continue;
    }

    const auto candidates = by_identity.find(IdentityKey(original.Identity()));
    if (candidates == by_identity.end()) {
      continue;
    }

    for (auto slot : candidates->second) {
      if (consumed[slot] || !PathCompatible(collapsed[slot], original)) {
        continue;
      }
      consumed[slot] = true;
      auto& replacement = collapsed[slot];
      if (!replacement.provenance().HasPath()) {
        replacement.set_provenance(original.provenance());
      }
      merged.push_back(std::move(replacement));
      break;
    }
  }

  for (std::size_t slot = 0; slot < collapsed.size(); ++slot) {
    if (consumed[slot]) {
      continue;
    }
    auto& created = collapsed[slot];
    if (!created.provenance().HasPath()) {
      const auto path       = DefaultPathFor(created.Identity(), anchor);
      int        next_index = 0;
      for (const auto& existing : merged) {
        if (existing.provenance().path == path) {
          next_index = std::max(next_index, existing.provenance().index + 1);
        }
      }
      created.set_provenance(model::Provenance{path, next_index});
    }
    merged.push_back(std::move(created));
  }

  return merged;
}

} // namespace fnpipe::pipeline
