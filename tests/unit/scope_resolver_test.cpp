#include "internal/pipeline/scope_resolver.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using fnpipe::pipeline::ScopeResolver;
using fnpipe::testing::ConfigMap;

std::vector<fnpipe::model::Resource> Package() {
  return {
      ConfigMap("root", "root.yaml"),
      ConfigMap("app", "app/app.yaml"),
      ConfigMap("nested", "app/db/db.yaml"),
      ConfigMap("sibling", "apple/apple.yaml"),
  };
}

template <typename Fn>
bool ThrowsScopeError(Fn fn) {
  try {
    fn();
  } catch (const fnpipe::util::ScopeResolutionError&) {
    return true;
  }
  return false;
}

void TestDirectoryAndDescendantsAreInScope() {
  const auto items = Package();
  const auto split = ScopeResolver().Resolve(items, "app");

  assert((split.scoped == std::vector<std::size_t>{1, 2}));
  assert((split.complement == std::vector<std::size_t>{0, 3}));
}

void TestRootAnchorSeesEverything() {
  const auto items = Package();
  const auto split = ScopeResolver().Resolve(items, "");
  assert(split.scoped.size() == items.size());
  assert(split.complement.empty());
}

void TestGlobalScopeSeesEverything() {
  const auto items = Package();
  const auto split = ScopeResolver(true).Resolve(items, "app/db");
  assert(split.scoped.size() == items.size());
}

void TestContainsMatchesWholeComponents() {
  assert(ScopeResolver::Contains("app", "app"));
  assert(ScopeResolver::Contains("app", "app/db"));
  assert(!ScopeResolver::Contains("app", "apple"));
  assert(!ScopeResolver::Contains("app/db", "app"));
  assert(ScopeResolver::Contains("", "anything/at/all"));
}

void TestDeclaringResourceIsInItsOwnScope() {
  auto       items  = Package();
  const auto anchor = ScopeResolver::AnchorFor(items[2]);
  assert(anchor == "app/db");
  const auto split = ScopeResolver().Resolve(items, anchor);
  assert((split.scoped == std::vector<std::size_t>{2}));
}

void TestInvalidAnchorsAreRejected() {
  const auto items = Package();
  assert(ThrowsScopeError([&] { ScopeResolver().Resolve(items, "/abs"); }));
  assert(ThrowsScopeError([&] { ScopeResolver().Resolve(items, "../up"); }));
  assert(ThrowsScopeError([&] { ScopeResolver().Resolve(items, "a//b"); }));
  assert(ThrowsScopeError([] { ScopeResolver::AnchorFor(ConfigMap("nowhere", "")); }));
  assert(ThrowsScopeError([] { ScopeResolver::AnchorFor(ConfigMap("escape", "../x.yaml")); }));
}

} // namespace

int main() {
  TestDirectoryAndDescendantsAreInScope();
  TestRootAnchorSeesEverything();
  TestGlobalScopeSeesEverything();
  TestContainsMatchesWholeComponents();
  TestDeclaringResourceIsInItsOwnScope();
  TestInvalidAnchorsAreRejected();

  std::cout << "fnpipe_unit_scope_resolver: pass\n";
  return 0;
}
