#include "local_package_store.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

#include "internal/model/resource_list_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fnpipe::store {

namespace fs = std::filesystem;

namespace {

using fnpipe::observability::IntField;
using fnpipe::observability::StringField;
using fnpipe::util::DocumentParseError;
using fnpipe::util::PersistenceError;

bool IsHidden(const fs::path& path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

bool IsYamlFile(const fs::path& path) {
  const auto ext = path.extension().string();
  return ext == ".yaml" || ext == ".yml";
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw DocumentParseError("cannot open " + path.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

// Resource paths come from functions; they must stay inside the package.
void ValidateResourcePath(const std::string& path) {
  if (path.empty()) {
    throw PersistenceError("resource has no path");
  }
  const fs::path p(path);
  if (p.is_absolute()) {
    throw PersistenceError("resource path '" + path + "' must be relative");
  }
  for (const auto& component : p) {
    if (component == ".." || component == ".") {
      throw PersistenceError("resource path '" + path + "' must not contain '.' or '..'");
    }
  }
}

void WriteFileAtomically(const fs::path& path, const std::string& content) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw PersistenceError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
  }

  const auto    temp = path.parent_path() / ("." + path.filename().string() + ".fnpipe-tmp");
  std::ofstream out(temp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw PersistenceError("cannot open " + temp.string() + " for writing");
  }
  out << content;
  out.close();
  if (!out) {
    fs::remove(temp, ec);
    throw PersistenceError("failed to write " + temp.string());
  }

  fs::rename(temp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw PersistenceError("cannot replace " + path.string() + ": " + ec.message());
  }
}

} // namespace

LocalPackageStore::LocalPackageStore(fs::path root, std::vector<fs::path> excluded) : root_(std::move(root)) {
  for (auto& path : excluded) {
    std::error_code ec;
    auto            absolute = fs::weakly_canonical(path, ec);
    excluded_.push_back(ec ? path.lexically_normal() : absolute);
  }
}

bool LocalPackageStore::IsExcluded(const fs::path& path) const {
  if (excluded_.empty()) {
    return false;
  }
  std::error_code ec;
  const auto      canonical = fs::weakly_canonical(path, ec);
  return std::find(excluded_.begin(), excluded_.end(), ec ? path : canonical) != excluded_.end();
}

model::ResourceCollection LocalPackageStore::Read() {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    throw DocumentParseError("package root " + root_.string() + " is not a directory");
  }

  std::vector<std::string> files;
  for (auto it = fs::recursive_directory_iterator(root_, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    if (IsHidden(entry.path()) || (entry.is_directory() && IsExcluded(entry.path()))) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file() && IsYamlFile(entry.path())) {
      files.push_back(entry.path().lexically_relative(root_).generic_string());
    }
  }
  if (ec) {
    throw DocumentParseError("cannot walk " + root_.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  model::ResourceCollection collection;
  read_snapshot_.clear();

  for (const auto& relative : files) {
    std::vector<YAML::Node> documents;
    try {
      documents = YAML::LoadAll(ReadFile(root_ / relative));
    } catch (const YAML::Exception& e) {
      throw DocumentParseError(relative + ": " + e.what());
    }

    std::vector<YAML::Node> kept;
    for (std::size_t index = 0; index < documents.size(); ++index) {
      const YAML::Node& document = documents[index];
      if (!document || document.IsNull()) {
        continue;
      }
      if (!document.IsMap()) {
        throw DocumentParseError(relative + ": document " + std::to_string(index) + " is not a mapping");
      }
      kept.push_back(document);
      collection.items.emplace_back(document, model::Provenance{relative, static_cast<int>(index)});
    }
    if (!kept.empty()) {
      read_snapshot_[relative] = model::EmitDocumentStream(kept);
    }
  }

  FNPIPE_LOG_DEBUG("package read", {StringField("root", root_.string()), IntField("files", static_cast<std::int64_t>(files.size())),
                                    IntField("resources", static_cast<std::int64_t>(collection.items.size()))});
  return collection;
}

void LocalPackageStore::Write(const model::ResourceCollection& collection) {
  struct Slot {
    int                    index;
    const model::Resource* resource;
  };

  std::map<std::string, std::vector<Slot>> by_path;
  for (std::size_t order = 0; order < collection.items.size(); ++order) {
    const auto& resource = collection.items[order];
    ValidateResourcePath(resource.provenance().path);
    by_path[resource.provenance().path].push_back(Slot{resource.provenance().index, &resource});
  }

  std::size_t written = 0;
  for (auto& [path, slots] : by_path) {
    std::stable_sort(slots.begin(), slots.end(), [](const Slot& lhs, const Slot& rhs) {
      // Unknown indices go after known ones.
      const auto lhs_index = lhs.index < 0 ? std::numeric_limits<int>::max() : lhs.index;
      const auto rhs_index = rhs.index < 0 ? std::numeric_limits<int>::max() : rhs.index;
      return lhs_index < rhs_index;
    });

    std::vector<YAML::Node> documents;
    documents.reserve(slots.size());
    for (const auto& slot : slots) {
      documents.push_back(slot.resource->Document());
    }

    auto content  = model::EmitDocumentStream(documents);
    auto snapshot = read_snapshot_.find(path);
    if (snapshot != read_snapshot_.end() && snapshot->second == content) {
      continue;
    }

    WriteFileAtomically(root_ / path, content);
    read_snapshot_[path] = std::move(content);
    ++written;
  }

  std::size_t removed = 0;
  for (auto it = read_snapshot_.begin(); it != read_snapshot_.end();) {
    if (by_path.count(it->first) != 0) {
      ++it;
      continue;
    }
    std::error_code ec;
    fs::remove(root_ / it->first, ec);
    if (ec) {
      throw PersistenceError("cannot remove " + (root_ / it->first).string() + ": " + ec.message());
    }
    it = read_snapshot_.erase(it);
    ++removed;
  }

  FNPIPE_LOG_INFO("package written", {StringField("root", root_.string()), IntField("files_written", static_cast<std::int64_t>(written)),
                                      IntField("files_removed", static_cast<std::int64_t>(removed))});
}

} // namespace fnpipe::store
