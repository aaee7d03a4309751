#pragma once

#include <memory>
#include <sstream>
#include <string>

#include "io/abstract_object_client.hpp"
#include "io/http/http_client.hpp"

namespace objcp {

const char kGcsDefaultEndpoint[] = "https://storage.googleapis.com";
const int kGcsMaxResults = 1000;

struct GcsConfig {
  std::string endpoint = kGcsDefaultEndpoint;
  std::string bucket;
  std::string prefix;
  // OAuth2 bearer token, obtained outside this tool
  std::string access_token;
  int max_results = kGcsMaxResults;

  std::string DebugString() const {
    std::stringstream ss;
    ss << "{ endpoint: " << endpoint << ", bucket: " << bucket << ", prefix: " << prefix
       << " }";
    return ss.str();
  }
};

// Parse an objects.list response. next_marker is the page token.
IOStatus ParseObjectList(const std::string& json, ObjectListing* listing);

/*
 * Client for the GCS JSON API of one bucket.
 */
class GcsClient : public AbstractObjectClient {
 public:
  static IOStatus Create(const GcsConfig& config, std::shared_ptr<GcsClient>* client);

  virtual IOStatus ListObjects(const std::string& prefix, const std::string& marker,
                               ObjectListing* listing) override;
  virtual IOStatus GetObject(const std::string& key,
                             std::unique_ptr<AbstractReader>* reader) override;
  virtual IOStatus PutObject(const std::string& key, AbstractReader* content, size_t size,
                             const std::string& content_type) override;
  virtual std::string Name() const override { return "gs://" + config_.bucket; }

 private:
  GcsClient(GcsConfig config, HttpEndpoint endpoint)
      : config_(std::move(config)), http_(std::move(endpoint)) {}

  void Authorize(HttpRequest* request) const;

  GcsConfig config_;
  HttpClient http_;
};

}  // namespace objcp
