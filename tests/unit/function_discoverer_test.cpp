#include "internal/pipeline/function_discoverer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using fnpipe::model::Provenance;
using fnpipe::model::ResourceCollection;
using fnpipe::pipeline::FunctionDiscoverer;
using fnpipe::testing::ConfigMap;
using fnpipe::testing::FunctionResource;

std::vector<std::string> Images(const fnpipe::model::ExecutionPlan& plan) {
  std::vector<std::string> images;
  for (const auto& invocation : plan.invocations()) {
    images.push_back(invocation.declaration.Name());
  }
  return images;
}

void TestNestedDirectoriesRunBeforeTheirParent() {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("outer", "outer", "a/fn.yaml"));
  collection.items.push_back(FunctionResource("inner", "inner", "a/b/fn.yaml"));
  collection.items.push_back(FunctionResource("root", "root", "fn.yaml"));

  const auto plan = FunctionDiscoverer().Discover(collection);
  assert((Images(plan) == std::vector<std::string>{"inner", "outer", "root"}));
  assert(plan.invocations()[0].anchor == "a/b");
  assert(plan.invocations()[1].anchor == "a");
  assert(plan.invocations()[2].anchor.empty());
}

void TestSiblingDirectoriesRunInLexicalOrder() {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("z", "zeta", "z/fn.yaml"));
  collection.items.push_back(FunctionResource("b", "beta", "b/fn.yaml"));
  collection.items.push_back(FunctionResource("a2", "alpha-nested", "a/x/fn.yaml"));
  collection.items.push_back(FunctionResource("a", "alpha", "a/fn.yaml"));

  const auto plan = FunctionDiscoverer().Discover(collection);
  assert((Images(plan) == std::vector<std::string>{"alpha-nested", "alpha", "beta", "zeta"}));
}

void TestDocumentOrderWithinAStream() {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("second", "f2", "fns.yaml", 1));
  collection.items.push_back(ConfigMap("data", "fns.yaml", 2));
  collection.items.push_back(FunctionResource("first", "f1", "fns.yaml", 0));
  collection.items.push_back(FunctionResource("other-file", "f0", "a.yaml", 0));

  const auto plan = FunctionDiscoverer().Discover(collection);
  assert((Images(plan) == std::vector<std::string>{"f0", "f1", "f2"}));
  for (std::size_t i = 0; i < plan.size(); ++i) {
    assert(plan.invocations()[i].sequence == i);
  }
}

void TestSameFunctionInSeveralDirectoriesIsInvokedPerDirectory() {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("lint", "linter", "a/fn.yaml"));
  collection.items.push_back(FunctionResource("lint", "linter", "b/fn.yaml"));

  const auto plan = FunctionDiscoverer().Discover(collection);
  assert(plan.size() == 2);
  assert(plan.invocations()[0].sequence != plan.invocations()[1].sequence);
}

void TestMalformedDeclarationAbortsDiscovery() {
  ResourceCollection collection;
  collection.items.push_back(FunctionResource("good", "good", "a/fn.yaml"));
  auto bad = ConfigMap("bad", "b/fn.yaml");
  bad.SetAnnotation(fnpipe::model::kFunctionAnnotation, "container: {}");
  collection.items.push_back(bad);

  bool threw = false;
  try {
    (void)FunctionDiscoverer().Discover(collection);
  } catch (const fnpipe::util::DeclarationParseError&) {
    threw = true;
  }
  assert(threw);
}

void TestOrderingPredicate() {
  assert(FunctionDiscoverer::ExecutesBefore(Provenance{"a/b/x.yaml", 0}, Provenance{"a/x.yaml", 0}));
  assert(!FunctionDiscoverer::ExecutesBefore(Provenance{"a/x.yaml", 0}, Provenance{"a/b/x.yaml", 0}));
  assert(FunctionDiscoverer::ExecutesBefore(Provenance{"a/x.yaml", 5}, Provenance{"b/x.yaml", 0}));
  assert(FunctionDiscoverer::ExecutesBefore(Provenance{"x.yaml", 0}, Provenance{"x.yaml", 1}));
  assert(!FunctionDiscoverer::ExecutesBefore(Provenance{"x.yaml", 1}, Provenance{"x.yaml", 1}));
}

} // namespace

int main() {
  TestNestedDirectoriesRunBeforeTheirParent();
  TestSiblingDirectoriesRunInLexicalOrder();
  TestDocumentOrderWithinAStream();
  TestSameFunctionInSeveralDirectoriesIsInvokedPerDirectory();
  TestMalformedDeclarationAbortsDiscovery();
  TestOrderingPredicate();

  std::cout << "fnpipe_unit_function_discoverer: pass\n";
  return 0;
}
