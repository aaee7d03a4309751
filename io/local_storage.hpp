#pragma once

#include <string>

#include "io/abstract_storage.hpp"

namespace objcp {

/*
 * Local filesystem backend rooted at a directory (or a single file when
 * used as a source).
 */
class LocalStorage : public AbstractStorage {
 public:
  explicit LocalStorage(std::string root) : root_(std::move(root)) {}
  virtual ~LocalStorage() {}

  virtual std::shared_ptr<ItemStream> ListFiles() override;
  virtual IOStatus PutFile(Item item) override;

  const std::string& root() const { return root_; }

 private:
  std::string root_;
};

// Walk root recursively and push every non-directory entry into stream.
void WalkLocalRoot(const std::string& root, ItemStream* stream);

}  // namespace objcp
