#include "memory_resource_store.hpp"

namespace fnpipe::store {

MemoryResourceStore::MemoryResourceStore(model::ResourceCollection initial) : contents_(std::move(initial)) {
}

model::ResourceCollection MemoryResourceStore::Read() {
  auto collection = contents_.Clone();
  collection.function_config.reset();
  collection.results.clear();
  return collection;
}

void MemoryResourceStore::Write(const model::ResourceCollection& collection) {
  contents_ = collection.Clone();
  ++write_count_;
}

} // namespace fnpipe::store
