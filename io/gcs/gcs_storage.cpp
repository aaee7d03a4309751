#include "io/gcs/gcs_storage.hpp"

#include "glog/logging.h"

namespace objcp {

IOStatus GcsStorage::Create(const GcsConfig& config, std::shared_ptr<GcsStorage>* storage) {
  std::shared_ptr<GcsClient> client;
  IOStatus status = GcsClient::Create(config, &client);
  if (!status.ok()) {
    return status;
  }
  LOG(INFO) << "Using GCS bucket " << config.DebugString();
  *storage = std::make_shared<GcsStorage>(client, config);
  return IOStatus::OK();
}

}  // namespace objcp
