#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "internal/model/resource_collection.hpp"

namespace fnpipe::model {

/*
  ResourceList wire format.

    apiVersion: config.kubernetes.io/v1
    kind: ResourceList
    items: [...]
    functionConfig: {...}
    results:
    - name: <function>
      items: [{severity, message, tags, resourceRef, file, field}]

  Provenance travels as the path/index annotations on every item and on
  functionConfig. Parsing strips them back into Resource::provenance().
*/

inline constexpr const char* kResourceListApiVersion = "config.kubernetes.io/v1";

// Throws DocumentParseError when the text is not a well-formed ResourceList.
ResourceCollection ParseResourceList(const std::string& text);

std::string EmitResourceList(const ResourceCollection& collection);

// Single document emission that keeps quoted strings quoted, flow
// collections in flow style and multi-line strings as literal blocks.
std::string EmitDocument(const YAML::Node& node);

// Multi-document stream, documents separated by "---".
std::string EmitDocumentStream(const std::vector<YAML::Node>& documents);

YAML::Node ResultSetToNode(const ResultSet& result_set);
// Throws DocumentParseError on malformed result records.
ResultSet ResultSetFromNode(const YAML::Node& node);

// Clone of the document carrying provenance as annotations.
YAML::Node ToWireItem(const Resource& resource);
// Takes ownership of document; provenance annotations are moved into the
// returned resource's provenance.
Resource FromWireItem(YAML::Node document);

} // namespace fnpipe::model
