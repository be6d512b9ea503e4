#include "resource_list_codec.hpp"

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace fnpipe::model {

namespace {

using fnpipe::util::DocumentParseError;

bool IsBoolOrNullWord(const std::string& value) {
  static const char* const kWords[] = {"null", "Null", "NULL", "~",     "true", "True", "TRUE", "false", "False", "FALSE", "yes",
                                       "Yes",  "YES",  "no",   "No",    "NO",   "on",   "On",   "ON",    "off",   "Off",   "OFF",
                                       "y",    "Y",    "n",    "N"};
  for (const char* word : kWords) {
    if (value == word) {
      return true;
    }
  }
  return false;
}

// True when a plain (unquoted) scalar with this text would not read back
// as the same string.
bool ReadsAsNonString(const std::string& value) {
  if (value.empty() || IsBoolOrNullWord(value)) {
    return true;
  }

  char* endptr = nullptr;
  std::strtod(value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    return true;
  }

  if (value.size() > 2 && value[0] == '0' && (value[1] == 'o' || value[1] == 'x')) {
    return true;
  }

  return value == ".inf" || value == "-.inf" || value == ".nan" || value == ".Inf" || value == ".NaN";
}

void EmitNode(YAML::Emitter& out, const YAML::Node& node);

void EmitScalar(YAML::Emitter& out, const YAML::Node& node) {
  const std::string& tag   = node.Tag();
  const std::string& value = node.Scalar();

  if (!tag.empty() && tag != "?" && tag != "!") {
    out << YAML::VerbatimTag(tag);
  }

  if (tag == "!") {
    if (value.find('\n') != std::string::npos) {
      out << YAML::Literal << value;
      return;
    }
    if (ReadsAsNonString(value)) {
      out << YAML::DoubleQuoted << value;
      return;
    }
  }

  out << value;
}

void EmitNode(YAML::Emitter& out, const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out << YAML::Null;
      return;

    case YAML::NodeType::Scalar:
      EmitScalar(out, node);
      return;

    case YAML::NodeType::Sequence:
      if (node.Style() == YAML::EmitterStyle::Flow) {
        out << YAML::Flow;
      }
      out << YAML::BeginSeq;
      for (const auto& element : node) {
        EmitNode(out, element);
      }
      out << YAML::EndSeq;
      return;

    case YAML::NodeType::Map:
      if (node.Style() == YAML::EmitterStyle::Flow) {
        out << YAML::Flow;
      }
      out << YAML::BeginMap;
      for (const auto& entry : node) {
        out << YAML::Key;
        EmitNode(out, entry.first);
        out << YAML::Value;
        EmitNode(out, entry.second);
      }
      out << YAML::EndMap;
      return;
  }
}

std::string ScalarField(const YAML::Node& map, const char* key, const char* context) {
  const YAML::Node value = map[key];
  if (!value || value.IsNull()) {
    return {};
  }
  if (!value.IsScalar()) {
    throw DocumentParseError(std::string(context) + "." + key + " must be a scalar");
  }
  return value.Scalar();
}

std::optional<int> ParseIndex(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char*      endptr = nullptr;
  const long value  = std::strtol(text.c_str(), &endptr, 10);
  if (!endptr || *endptr != '\0' || value < 0 || value > 1'000'000) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

ResourceIdentity IdentityFromNode(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw DocumentParseError("result resourceRef must be a mapping");
  }
  ResourceIdentity id;
  id.api_version = ScalarField(node, "apiVersion", "resourceRef");
  id.kind        = ScalarField(node, "kind", "resourceRef");
  id.name        = ScalarField(node, "name", "resourceRef");
  id.namespace_  = ScalarField(node, "namespace", "resourceRef");
  return id;
}

FunctionResult ResultFromNode(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw DocumentParseError("result item must be a mapping");
  }

  FunctionResult result;
  const auto     severity = ScalarField(node, "severity", "result");
  if (!severity.empty()) {
    auto parsed = ParseSeverity(severity);
    if (!parsed) {
      throw DocumentParseError("unknown result severity '" + severity + "'");
    }
    result.severity = *parsed;
  }
  result.message = ScalarField(node, "message", "result");

  const YAML::Node tags = node["tags"];
  if (tags && !tags.IsNull()) {
    if (!tags.IsMap()) {
      throw DocumentParseError("result tags must be a mapping");
    }
    for (const auto& tag : tags) {
      if (!tag.second.IsScalar()) {
        throw DocumentParseError("result tag values must be scalars");
      }
      result.tags[tag.first.Scalar()] = tag.second.Scalar();
    }
  }

  const YAML::Node ref = node["resourceRef"];
  if (ref && !ref.IsNull()) {
    result.resource_ref = IdentityFromNode(ref);
  }

  const YAML::Node file = node["file"];
  if (file && !file.IsNull()) {
    if (!file.IsMap()) {
      throw DocumentParseError("result file must be a mapping");
    }
    FileLocation location;
    location.path  = ScalarField(file, "path", "file");
    location.index = ParseIndex(ScalarField(file, "index", "file"));
    result.file    = std::move(location);
  }

  const YAML::Node field = node["field"];
  if (field && !field.IsNull()) {
    if (!field.IsMap()) {
      throw DocumentParseError("result field must be a mapping");
    }
    FieldReference reference;
    reference.path = ScalarField(field, "path", "field");
    if (field["currentValue"]) {
      reference.current_value = YAML::Clone(field["currentValue"]);
    }
    if (field["suggestedValue"]) {
      reference.suggested_value = YAML::Clone(field["suggestedValue"]);
    }
    result.field = std::move(reference);
  }

  return result;
}

YAML::Node IdentityToNode(const ResourceIdentity& id) {
  YAML::Node node(YAML::NodeType::Map);
  if (!id.api_version.empty()) {
    node["apiVersion"] = id.api_version;
  }
  if (!id.kind.empty()) {
    node["kind"] = id.kind;
  }
  if (!id.name.empty()) {
    node["name"] = id.name;
  }
  if (!id.namespace_.empty()) {
    node["namespace"] = id.namespace_;
  }
  return node;
}

YAML::Node ResultToNode(const FunctionResult& result) {
  YAML::Node node(YAML::NodeType::Map);
  node["message"]  = StringScalar(result.message);
  node["severity"] = std::string(ToString(result.severity));

  if (!result.tags.empty()) {
    YAML::Node tags(YAML::NodeType::Map);
    for (const auto& [key, value] : result.tags) {
      tags[key] = StringScalar(value);
    }
    node["tags"] = tags;
  }
  if (result.resource_ref) {
    node["resourceRef"] = IdentityToNode(*result.resource_ref);
  }
  if (result.file) {
    YAML::Node file(YAML::NodeType::Map);
    file["path"] = StringScalar(result.file->path);
    if (result.file->index) {
      file["index"] = *result.file->index;
    }
    node["file"] = file;
  }
  if (result.field) {
    YAML::Node field(YAML::NodeType::Map);
    field["path"] = StringScalar(result.field->path);
    if (!result.field->current_value.IsNull()) {
      field["currentValue"] = YAML::Clone(result.field->current_value);
    }
    if (!result.field->suggested_value.IsNull()) {
      field["suggestedValue"] = YAML::Clone(result.field->suggested_value);
    }
    node["field"] = field;
  }
  return node;
}

} // namespace

std::string EmitDocument(const YAML::Node& node) {
  YAML::Emitter out;
  EmitNode(out, node);
  if (!out.good()) {
    throw DocumentParseError("failed to emit YAML document: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

std::string EmitDocumentStream(const std::vector<YAML::Node>& documents) {
  std::string stream;
  for (std::size_t i = 0; i < documents.size(); ++i) {
    if (i > 0) {
      stream += "---\n";
    }
    stream += EmitDocument(documents[i]);
  }
  return stream;
}

YAML::Node ToWireItem(const Resource& resource) {
  Resource wire = resource.Clone();
  if (resource.provenance().HasPath()) {
    wire.SetAnnotation(kPathAnnotation, resource.provenance().path);
    if (resource.provenance().index >= 0) {
      wire.SetAnnotation(kIndexAnnotation, std::to_string(resource.provenance().index));
    }
  }
  return wire.Document();
}

Resource FromWireItem(YAML::Node document) {
  Resource   resource(std::move(document));
  Provenance provenance;
  if (auto path = resource.Annotation(kPathAnnotation)) {
    provenance.path = *path;
  }
  if (auto index = resource.Annotation(kIndexAnnotation)) {
    provenance.index = ParseIndex(*index).value_or(-1);
  }
  resource.RemoveAnnotation(kPathAnnotation);
  resource.RemoveAnnotation(kIndexAnnotation);
  resource.set_provenance(std::move(provenance));
  return resource;
}

YAML::Node ResultSetToNode(const ResultSet& result_set) {
  YAML::Node node(YAML::NodeType::Map);
  node["name"] = StringScalar(result_set.name);
  YAML::Node items(YAML::NodeType::Sequence);
  for (const auto& result : result_set.items) {
    items.push_back(ResultToNode(result));
  }
  node["items"] = items;
  return node;
}

ResultSet ResultSetFromNode(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw DocumentParseError("result set must be a mapping");
  }

  ResultSet result_set;
  result_set.name = ScalarField(node, "name", "results");

  const YAML::Node items = node["items"];
  if (items && !items.IsNull()) {
    if (!items.IsSequence()) {
      throw DocumentParseError("results[].items must be a sequence");
    }
    for (const auto& item : items) {
      result_set.items.push_back(ResultFromNode(item));
    }
  }
  return result_set;
}

ResourceCollection ParseResourceList(const std::string& text) {
  YAML::Node parsed;
  try {
    parsed = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw DocumentParseError(std::string("resource list is not valid YAML: ") + e.what());
  }

  const YAML::Node& root = parsed;
  if (!root.IsMap()) {
    throw DocumentParseError("resource list must be a mapping");
  }

  const auto kind = ScalarField(root, "kind", "ResourceList");
  if (kind != "ResourceList" && kind != "List") {
    throw DocumentParseError("unexpected resource list kind '" + kind + "'");
  }

  ResourceCollection collection;

  const YAML::Node items = root["items"];
  if (items && !items.IsNull()) {
    if (!items.IsSequence()) {
      throw DocumentParseError("ResourceList.items must be a sequence");
    }
    for (const auto& item : items) {
      if (!item.IsMap()) {
        throw DocumentParseError("ResourceList.items entries must be mappings");
      }
      collection.items.push_back(FromWireItem(item));
    }
  }

  const YAML::Node function_config = root["functionConfig"];
  if (function_config && !function_config.IsNull()) {
    if (!function_config.IsMap()) {
      throw DocumentParseError("ResourceList.functionConfig must be a mapping");
    }
    collection.function_config = FromWireItem(function_config);
  }

  const YAML::Node results = root["results"];
  if (results && !results.IsNull()) {
    if (!results.IsSequence()) {
      throw DocumentParseError("ResourceList.results must be a sequence");
    }
    for (const auto& result_set : results) {
      collection.results.push_back(ResultSetFromNode(result_set));
    }
  }

  return collection;
}

std::string EmitResourceList(const ResourceCollection& collection) {
  YAML::Node root(YAML::NodeType::Map);
  root["apiVersion"] = kResourceListApiVersion;
  root["kind"]       = "ResourceList";

  YAML::Node items(YAML::NodeType::Sequence);
  for (const auto& item : collection.items) {
    items.push_back(ToWireItem(item));
  }
  root["items"] = items;

  if (collection.function_config) {
    root["functionConfig"] = ToWireItem(*collection.function_config);
  }

  if (!collection.results.empty()) {
    YAML::Node results(YAML::NodeType::Sequence);
    for (const auto& result_set : collection.results) {
      results.push_back(ResultSetToNode(result_set));
    }
    root["results"] = results;
  }

  return EmitDocument(root);
}

} // namespace fnpipe::model
