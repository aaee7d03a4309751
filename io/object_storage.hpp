#pragma once

#include <memory>
#include <string>

#include "io/abstract_object_client.hpp"
#include "io/abstract_storage.hpp"

namespace objcp {

/*
 * Storage semantics shared by the object-store backends: the key prefix is
 * both the enumeration filter and the root that writes are placed under.
 */
class ObjectStorage : public AbstractStorage {
 public:
  ObjectStorage(std::shared_ptr<AbstractObjectClient> client, std::string prefix)
      : client_(client), prefix_(std::move(prefix)) {}
  virtual ~ObjectStorage() {}

  virtual std::shared_ptr<ItemStream> ListFiles() override;
  virtual IOStatus PutFile(Item item) override;

  const std::string& prefix() const { return prefix_; }

 private:
  std::shared_ptr<AbstractObjectClient> client_;
  std::string prefix_;
};

// Page through every object under prefix and push each one into stream.
void ListBucket(std::shared_ptr<AbstractObjectClient> client, const std::string& prefix,
                ItemStream* stream);

}  // namespace objcp
