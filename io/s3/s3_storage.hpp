#pragma once

#include <memory>

#include "io/object_storage.hpp"
#include "io/s3/s3_client.hpp"

namespace objcp {

/*
 * An S3 (or S3-compatible) bucket. config.prefix filters enumeration and
 * roots writes.
 */
class S3Storage : public ObjectStorage {
 public:
  S3Storage(std::shared_ptr<S3Client> client, const S3Config& config)
      : ObjectStorage(client, config.prefix) {}

  // Fails on configuration errors; does not contact the service.
  static IOStatus Create(const S3Config& config, std::shared_ptr<S3Storage>* storage);
};

}  // namespace objcp
