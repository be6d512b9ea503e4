#pragma once

#include <memory>

#include "internal/model/resource_collection.hpp"

namespace fnpipe::store {

/*
  Source and sink of the resource collection for one run.

  Read() tags every resource with its provenance. Write() persists a
  collection produced from that read, laying resources out by provenance.
  Both throw: DocumentParseError on unreadable input, PersistenceError on
  write failures.
*/
class ResourceStore {
 public:
  virtual ~ResourceStore() = default;

  virtual model::ResourceCollection Read()                                        = 0;
  virtual void                      Write(const model::ResourceCollection& collection) = 0;
};

using ResourceStorePtr = std::shared_ptr<ResourceStore>;

} // namespace fnpipe::store
