#pragma once

#include <cstddef>

#include "internal/store/resource_store.hpp"

namespace fnpipe::store {

// In-memory store used by tests; counts writes so callers can check that
// aborted runs never reach the sink.
class MemoryResourceStore final : public ResourceStore {
 public:
  explicit MemoryResourceStore(model::ResourceCollection initial = {});

  model::ResourceCollection Read() override;
  void                      Write(const model::ResourceCollection& collection) override;

  const model::ResourceCollection& contents() const {
    return contents_;
  }
  std::size_t write_count() const {
    return write_count_;
  }

 private:
  model::ResourceCollection contents_;
  std::size_t               write_count_ = 0;
};

} // namespace fnpipe::store
