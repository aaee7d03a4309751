#pragma once

#include <memory>

#include "io/io_status.hpp"
#include "io/item.hpp"
#include "io/item_stream.hpp"

namespace objcp {

/*
 * The capability every storage backend provides to the copy engine.
 * Any prefixing has to be implemented and enforced by the backend.
 */
class AbstractStorage {
 public:
  virtual ~AbstractStorage() {}

  // Enumerate every item under the configured root or prefix. Enumeration
  // failures are logged and end the stream early.
  virtual std::shared_ptr<ItemStream> ListFiles() = 0;

  // Write item at its relative path under this backend's own root or prefix.
  // item.content is consumed and released before returning.
  virtual IOStatus PutFile(Item item) = 0;
};

}  // namespace objcp
