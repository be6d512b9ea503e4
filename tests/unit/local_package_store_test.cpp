#include "internal/store/local_package_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using fnpipe::model::Provenance;
using fnpipe::store::LocalPackageStore;
using fnpipe::testing::ConfigMap;
using fnpipe::testing::FreshDirectory;
using fnpipe::testing::Names;
using fnpipe::testing::ReadWholeFile;
using fnpipe::testing::WriteFile;

constexpr const char* kTwoDocuments = R"(# comment kept while untouched
apiVersion: v1
kind: ConfigMap
metadata:
  name: one
---
apiVersion: v1
kind: ConfigMap
metadata:
  name: two
)";

fs::path SamplePackage(const std::string& name) {
  const auto root = FreshDirectory(name);
  WriteFile(root / "b.yaml", kTwoDocuments);
  WriteFile(root / "a/nested.yml", "apiVersion: v1\nkind: Secret\nmetadata:\n  name: nested\n");
  WriteFile(root / ".hidden/skip.yaml", "apiVersion: v1\nkind: Secret\nmetadata:\n  name: hidden\n");
  WriteFile(root / ".skip.yaml", "apiVersion: v1\nkind: Secret\nmetadata:\n  name: dotfile\n");
  WriteFile(root / "README.md", "not yaml\n");
  return root;
}

void TestReadWalksYamlInLexicalOrder() {
  LocalPackageStore store(SamplePackage("store_read"));
  const auto        collection = store.Read();

  assert((Names(collection.items) == std::vector<std::string>{"nested", "one", "two"}));
  assert((collection.items[0].provenance() == Provenance{"a/nested.yml", 0}));
  assert((collection.items[1].provenance() == Provenance{"b.yaml", 0}));
  assert((collection.items[2].provenance() == Provenance{"b.yaml", 1}));
}

void TestUntouchedFilesAreNotRewritten() {
  const auto        root = SamplePackage("store_untouched");
  LocalPackageStore store(root);
  const auto        collection = store.Read();

  store.Write(collection);
  assert(ReadWholeFile(root / "b.yaml") == kTwoDocuments);
}

void TestWriteRegroupsAndRemovesEmptiedFiles() {
  const auto        root = SamplePackage("store_write");
  LocalPackageStore store(root);
  auto              collection = store.Read();

  // Drop "one", move "nested" to a new file, add a resource before "two".
  std::vector<fnpipe::model::Resource> items;
  auto                                 moved = collection.items[0];
  moved.set_provenance(Provenance{"c/moved.yaml", 0});
  items.push_back(moved);
  items.push_back(collection.items[2]);
  items.push_back(ConfigMap("zero", "b.yaml", 0));
  collection.items = items;

  store.Write(collection);

  assert(!fs::exists(root / "a/nested.yml"));
  assert(fs::exists(root / "c/moved.yaml"));
  assert(fs::exists(root / ".skip.yaml"));

  LocalPackageStore reread(root);
  const auto        after = reread.Read();
  assert((Names(after.items) == std::vector<std::string>{"zero", "two", "nested"}));
  assert((after.items[1].provenance() == Provenance{"b.yaml", 1}));
  assert(after.items[0].Annotation(fnpipe::model::kPathAnnotation) == std::nullopt);
}

void TestExcludedDirectoriesAreSkipped() {
  const auto root = SamplePackage("store_excluded");
  WriteFile(root / "results/results-0.yaml", "apiVersion: v1\nkind: FunctionResultList\nmetadata:\n  name: r\n");

  LocalPackageStore store(root, {root / "results"});
  assert(store.Read().items.size() == 3);
}

void TestEscapingPathsAreRejected() {
  const auto        root = SamplePackage("store_escape");
  LocalPackageStore store(root);
  auto              collection = store.Read();
  collection.items[0].set_provenance(Provenance{"../outside.yaml", 0});

  bool threw = false;
  try {
    store.Write(collection);
  } catch (const fnpipe::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(root.parent_path() / "outside.yaml"));
}

void TestMalformedDocumentsFailTheRead() {
  const auto root = FreshDirectory("store_malformed");
  WriteFile(root / "bad.yaml", "apiVersion: v1\nkind: [unclosed\n");

  bool threw = false;
  try {
    (void)LocalPackageStore(root).Read();
  } catch (const fnpipe::util::DocumentParseError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReadWalksYamlInLexicalOrder();
  TestUntouchedFilesAreNotRewritten();
  TestWriteRegroupsAndRemovesEmptiedFiles();
  TestExcludedDirectoriesAreSkipped();
  TestEscapingPathsAreRejected();
  TestMalformedDocumentsFailTheRead();

  std::cout << "fnpipe_unit_local_package_store: pass\n";
  return 0;
}
