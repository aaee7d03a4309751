#pragma once

#include <memory>
#include <sstream>
#include <string>

#include "io/abstract_object_client.hpp"
#include "io/http/http_client.hpp"
#include "io/s3/s3_signer.hpp"

namespace objcp {

const int kS3MaxKeys = 1000;

struct S3Config {
  // scheme://host[:port] of the S3 service
  std::string endpoint;
  std::string region;
  std::string bucket;
  std::string prefix;
  S3Credentials credentials;
  int max_keys = kS3MaxKeys;

  std::string DebugString() const {
    std::stringstream ss;
    ss << "{ endpoint: " << endpoint << ", region: " << region << ", bucket: " << bucket
       << ", prefix: " << prefix << ", access_key: " << credentials.access_key << " }";
    return ss.str();
  }
};

// Fill endpoint and bucket from a path-style bucket url such as
// https://s3-us-west-1.amazonaws.com/bucket. Unless config->region is
// already set, the region is looked up by endpoint.
IOStatus ParseS3BucketUrl(const std::string& url, S3Config* config);

// Parse a ListObjects (v1) response. next_marker is the last key when the
// service does not send NextMarker.
IOStatus ParseListBucketResult(const std::string& xml, ObjectListing* listing);

/*
 * Path-style S3 REST client for one bucket.
 */
class S3Client : public AbstractObjectClient {
 public:
  static IOStatus Create(const S3Config& config, std::shared_ptr<S3Client>* client);

  virtual IOStatus ListObjects(const std::string& prefix, const std::string& marker,
                               ObjectListing* listing) override;
  virtual IOStatus GetObject(const std::string& key,
                             std::unique_ptr<AbstractReader>* reader) override;
  virtual IOStatus PutObject(const std::string& key, AbstractReader* content, size_t size,
                             const std::string& content_type) override;
  virtual std::string Name() const override { return "s3://" + config_.bucket; }

 private:
  S3Client(S3Config config, HttpEndpoint endpoint)
      : config_(std::move(config)), http_(std::move(endpoint)),
        signer_(config_.credentials, config_.region) {}

  std::string ObjectTarget(const std::string& key) const;

  S3Config config_;
  HttpClient http_;
  S3Signer signer_;
};

}  // namespace objcp
