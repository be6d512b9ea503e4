#include "internal/model/resource_list_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using fnpipe::model::EmitDocument;
using fnpipe::model::EmitResourceList;
using fnpipe::model::ParseResourceList;
using fnpipe::model::Severity;
using fnpipe::testing::ConfigMap;
using fnpipe::testing::MakeResource;

template <typename Fn>
bool ThrowsParseError(Fn fn) {
  try {
    fn();
  } catch (const fnpipe::util::DocumentParseError&) {
    return true;
  }
  return false;
}

void TestProvenanceAnnotationsAreStrippedIntoProvenance() {
  auto collection = ParseResourceList(R"(apiVersion: config.kubernetes.io/v1
kind: ResourceList
items:
- apiVersion: v1
  kind: ConfigMap
  metadata:
    name: a
    annotations:
      config.kubernetes.io/path: apps/a.yaml
      config.kubernetes.io/index: '2'
- apiVersion: v1
  kind: ConfigMap
  metadata:
    name: b
    annotations:
      team: core
      config.kubernetes.io/path: b.yaml
)");

  assert(collection.items.size() == 2);
  const auto& a = collection.items[0];
  assert(a.provenance().path == "apps/a.yaml");
  assert(a.provenance().index == 2);
  assert(!a.Annotation(fnpipe::model::kPathAnnotation));
  // The annotations map emptied by stripping is removed.
  assert(!a.Document()["metadata"]["annotations"]);

  const auto& b = collection.items[1];
  assert(b.provenance().path == "b.yaml");
  assert(b.provenance().index == -1);
  assert(b.Annotation("team") == std::string("core"));
}

void TestEmitCarriesProvenanceWithoutMutatingSource() {
  fnpipe::model::ResourceCollection collection;
  collection.items.push_back(ConfigMap("a", "apps/a.yaml", 1));

  const auto text = EmitResourceList(collection);
  assert(text.find("config.kubernetes.io/path: apps/a.yaml") != std::string::npos);
  assert(text.find("config.kubernetes.io/index: \"1\"") != std::string::npos);
  assert(!collection.items[0].Annotation(fnpipe::model::kPathAnnotation));

  auto parsed = ParseResourceList(text);
  assert(parsed.items.size() == 1);
  assert(parsed.items[0].provenance() == collection.items[0].provenance());
  assert(parsed.items[0].Identity() == collection.items[0].Identity());
}

void TestUnknownFieldsSurvive() {
  fnpipe::model::ResourceCollection collection;
  collection.items.push_back(MakeResource(R"(apiVersion: example.com/v1
kind: Widget
metadata:
  name: w
spec:
  quoted: "true"
  port: 8080
  flow: [a, b]
  text: |
    line one
    line two
)",
                                          "w.yaml"));

  auto        parsed = ParseResourceList(EmitResourceList(collection));
  const auto& spec   = parsed.items[0].Document()["spec"];
  assert(spec["quoted"].Scalar() == "true");
  assert(spec["quoted"].Tag() == "!");
  assert(spec["port"].as<int>() == 8080);
  assert(spec["flow"].size() == 2);
  assert(spec["text"].Scalar().find("line one\nline two") == 0);
}

void TestQuotedScalarsStayQuotedOnEmit() {
  const auto emitted = EmitDocument(YAML::Load("a: \"123\"\nb: plain\nc: 'no'\n"));
  assert(emitted.find("a: \"123\"") != std::string::npos);
  assert(emitted.find("b: plain") != std::string::npos);
  assert(emitted.find("c: \"no\"") != std::string::npos);
}

void TestListKindAndMissingItemsAreAccepted() {
  auto list = ParseResourceList("apiVersion: v1\nkind: List\nitems: []\n");
  assert(list.items.empty());

  auto empty = ParseResourceList("apiVersion: config.kubernetes.io/v1\nkind: ResourceList\n");
  assert(empty.items.empty());
  assert(!empty.function_config);
}

void TestMalformedListsAreRejected() {
  assert(ThrowsParseError([] { ParseResourceList("- not\n- a map\n"); }));
  assert(ThrowsParseError([] { ParseResourceList("kind: ConfigMap\nitems: []\n"); }));
  assert(ThrowsParseError([] { ParseResourceList("kind: ResourceList\nitems: {a: b}\n"); }));
  assert(ThrowsParseError([] { ParseResourceList("kind: ResourceList\nitems:\n- scalar\n"); }));
  assert(ThrowsParseError([] { ParseResourceList("kind: ResourceList\nitems: [\n"); }));
}

void TestResultsAreParsed() {
  auto collection = ParseResourceList(R"(kind: ResourceList
items: []
results:
- name: validator
  items:
  - message: missing label
    severity: warning
    tags: {rule: labels}
    resourceRef: {apiVersion: v1, kind: ConfigMap, name: a, namespace: prod}
    file: {path: a.yaml, index: 0}
    field: {path: metadata.labels, suggestedValue: {app: a}}
  - message: no severity means error
)");

  assert(collection.results.size() == 1);
  const auto& set = collection.results[0];
  assert(set.name == "validator");
  assert(set.items.size() == 2);

  const auto& first = set.items[0];
  assert(first.severity == Severity::kWarn);
  assert(first.tags.at("rule") == "labels");
  assert(first.resource_ref->namespace_ == "prod");
  assert(first.file->path == "a.yaml");
  assert(first.file->index == 0);
  assert(first.field->path == "metadata.labels");
  assert(first.field->current_value.IsNull());
  assert(first.field->suggested_value["app"].Scalar() == "a");

  assert(set.items[1].severity == Severity::kError);

  assert(ThrowsParseError([] { ParseResourceList("kind: ResourceList\nresults:\n- name: x\n  items:\n  - severity: fatal\n"); }));
}

} // namespace

int main() {
  TestProvenanceAnnotationsAreStrippedIntoProvenance();
  TestEmitCarriesProvenanceWithoutMutatingSource();
  TestUnknownFieldsSurvive();
  TestQuotedScalarsStayQuotedOnEmit();
  TestListKindAndMissingItemsAreAccepted();
  TestMalformedListsAreRejected();
  TestResultsAreParsed();

  std::cout << "fnpipe_unit_resource_list_codec: pass\n";
  return 0;
}
