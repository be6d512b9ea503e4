#include "resource.hpp"

#include "internal/util/errors.hpp"

namespace fnpipe::model {

namespace {

std::string ScalarOrEmpty(const YAML::Node& node) {
  if (node && node.IsScalar()) {
    return node.Scalar();
  }
  return {};
}

} // namespace

std::string Provenance::Directory() const {
  const auto slash = path.rfind('/');
  if (slash == std::string::npos) {
    return {};
  }
  return path.substr(0, slash);
}

std::string ResourceIdentity::ToString() const {
  std::string out = api_version.empty() ? kind : api_version + "/" + kind;
  out += ' ';
  if (!namespace_.empty()) {
    out += namespace_ + "/";
  }
  out += name;
  return out;
}

Resource::Resource(YAML::Node document, Provenance provenance) : document_(std::move(document)), provenance_(std::move(provenance)) {
}

ResourceIdentity Resource::Identity() const {
  const YAML::Node& doc = document_;
  ResourceIdentity  id;
  if (!doc.IsMap()) {
    return id;
  }

  id.api_version = ScalarOrEmpty(doc["apiVersion"]);
  id.kind        = ScalarOrEmpty(doc["kind"]);

  const YAML::Node metadata = doc["metadata"];
  if (metadata && metadata.IsMap()) {
    id.namespace_ = ScalarOrEmpty(metadata["namespace"]);
    id.name       = ScalarOrEmpty(metadata["name"]);
  }
  return id;
}

std::optional<std::string> Resource::Annotation(std::string_view key) const {
  const YAML::Node& doc = document_;
  if (!doc.IsMap()) {
    return std::nullopt;
  }

  const YAML::Node metadata = doc["metadata"];
  if (!metadata || !metadata.IsMap()) {
    return std::nullopt;
  }

  const YAML::Node annotations = metadata["annotations"];
  if (!annotations || !annotations.IsMap()) {
    return std::nullopt;
  }

  const YAML::Node value = annotations[std::string(key)];
  if (!value || !value.IsScalar()) {
    return std::nullopt;
  }
  return value.Scalar();
}

void Resource::SetAnnotation(std::string_view key, const std::string& value) {
  const YAML::Node& doc = document_;
  if (!doc.IsMap()) {
    throw util::DocumentParseError("cannot annotate " + Identity().ToString() + ": document is not a mapping");
  }
  const YAML::Node metadata = doc["metadata"];
  if (metadata && !metadata.IsNull() && !metadata.IsMap()) {
    throw util::DocumentParseError("cannot annotate " + Identity().ToString() + ": metadata is not a mapping");
  }
  if (metadata && metadata.IsMap()) {
    const YAML::Node annotations = metadata["annotations"];
    if (annotations && !annotations.IsNull() && !annotations.IsMap()) {
      throw util::DocumentParseError("cannot annotate " + Identity().ToString() + ": metadata.annotations is not a mapping");
    }
  }
  document_["metadata"]["annotations"][std::string(key)] = StringScalar(value);
}

void Resource::RemoveAnnotation(std::string_view key) {
  const YAML::Node& doc = document_;
  if (!doc.IsMap() || !doc["metadata"] || !doc["metadata"].IsMap()) {
    return;
  }
  if (!doc["metadata"]["annotations"] || !doc["metadata"]["annotations"].IsMap()) {
    return;
  }

  YAML::Node metadata    = document_["metadata"];
  YAML::Node annotations = metadata["annotations"];
  annotations.remove(std::string(key));
  if (annotations.size() == 0) {
    metadata.remove("annotations");
  }
}

Resource Resource::Clone() const {
  return Resource(YAML::Clone(document_), provenance_);
}

YAML::Node StringScalar(const std::string& value) {
  YAML::Node node(value);
  node.SetTag("!");
  return node;
}

} // namespace fnpipe::model
