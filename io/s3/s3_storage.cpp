#include "io/s3/s3_storage.hpp"

#include "glog/logging.h"

namespace objcp {

IOStatus S3Storage::Create(const S3Config& config, std::shared_ptr<S3Storage>* storage) {
  std::shared_ptr<S3Client> client;
  IOStatus status = S3Client::Create(config, &client);
  if (!status.ok()) {
    return status;
  }
  LOG(INFO) << "Using S3 bucket " << config.DebugString();
  *storage = std::make_shared<S3Storage>(client, config);
  return IOStatus::OK();
}

}  // namespace objcp
