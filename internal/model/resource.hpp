#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace fnpipe::model {

inline constexpr std::string_view kPathAnnotation  = "config.kubernetes.io/path";
inline constexpr std::string_view kIndexAnnotation = "config.kubernetes.io/index";

/*
  Where a resource was read from: a slash separated path relative to the
  package root and the document position inside that file.
*/
struct Provenance {
  std::string path;
  int         index = -1;

  bool HasPath() const {
    return !path.empty();
  }

  // Parent directory of path, "" for files at the package root.
  std::string Directory() const;

  bool operator==(const Provenance& other) const {
    return path == other.path && index == other.index;
  }
};

struct ResourceIdentity {
  std::string api_version;
  std::string kind;
  std::string namespace_;
  std::string name;

  bool operator==(const ResourceIdentity& other) const {
    return api_version == other.api_version && kind == other.kind && namespace_ == other.namespace_ && name == other.name;
  }
  bool operator!=(const ResourceIdentity& other) const {
    return !(*this == other);
  }

  std::string ToString() const;
};

/*
  A resource is an opaque ordered document plus its provenance.

  The document is never interpreted beyond the identity fields and
  metadata.annotations; every other field is carried verbatim.
  YAML::Node has reference semantics, so Clone() must be used whenever a
  copy is handed to code that may mutate it.
*/
class Resource {
 public:
  explicit Resource(YAML::Node document, Provenance provenance = {});

  const YAML::Node& Document() const {
    return document_;
  }
  YAML::Node& MutableDocument() {
    return document_;
  }

  const Provenance& provenance() const {
    return provenance_;
  }
  void set_provenance(Provenance provenance) {
    provenance_ = std::move(provenance);
  }

  ResourceIdentity Identity() const;

  std::optional<std::string> Annotation(std::string_view key) const;
  // Throws DocumentParseError when metadata or metadata.annotations exists
  // but is not a mapping.
  void SetAnnotation(std::string_view key, const std::string& value);
  // Removes the annotation; drops the annotations map once it is empty.
  void RemoveAnnotation(std::string_view key);

  Resource Clone() const;

 private:
  YAML::Node document_;
  Provenance provenance_;
};

// Returns a string scalar that is always emitted as a string, even when the
// text would otherwise read as a number or boolean.
YAML::Node StringScalar(const std::string& value);

} // namespace fnpipe::model
