#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "internal/store/resource_store.hpp"

namespace fnpipe::store {

/*
  A package is a directory tree of multi-document YAML files.

  Read() walks *.yaml / *.yml in lexical path order, skipping hidden
  entries and excluded directories. Write() regroups resources by path,
  orders them by index, and rewrites only files whose content changed, so
  untouched files keep their comments and formatting. Files that held
  resources on read and hold none now are removed.
*/
class LocalPackageStore final : public ResourceStore {
 public:
  explicit LocalPackageStore(std::filesystem::path root, std::vector<std::filesystem::path> excluded = {});

  model::ResourceCollection Read() override;
  void                      Write(const model::ResourceCollection& collection) override;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  bool IsExcluded(const std::filesystem::path& path) const;

  std::filesystem::path              root_;
  std::vector<std::filesystem::path> excluded_;
  // Relative path -> canonical emission of the file as it was read.
  std::map<std::string, std::string> read_snapshot_;
};

} // namespace fnpipe::store
