#pragma once

#include <memory>

#include "io/gcs/gcs_client.hpp"
#include "io/object_storage.hpp"

namespace objcp {

/*
 * A GCS bucket. config.prefix filters enumeration and roots writes.
 */
class GcsStorage : public ObjectStorage {
 public:
  GcsStorage(std::shared_ptr<GcsClient> client, const GcsConfig& config)
      : ObjectStorage(client, config.prefix) {}

  // Fails on configuration errors; does not contact the service.
  static IOStatus Create(const GcsConfig& config, std::shared_ptr<GcsStorage>* storage);
};

}  // namespace objcp
