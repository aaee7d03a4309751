#include "io/s3/s3_client.hpp"

#include <sstream>

#include "boost/property_tree/ptree.hpp"
#include "boost/property_tree/xml_parser.hpp"
#include "glog/logging.h"

#include "io/s3/s3_regions.hpp"

namespace objcp {

namespace pt = boost::property_tree;

namespace {

const char kBucketOwnerFull[] = "bucket-owner-full-control";

}  // namespace

IOStatus ParseS3BucketUrl(const std::string& url, S3Config* config) {
  HttpEndpoint endpoint;
  std::string path;
  IOStatus status = ParseEndpoint(url, &endpoint, &path);
  if (!status.ok()) {
    return status;
  }
  size_t start = path.find_first_not_of('/');
  if (start == std::string::npos) {
    return IOStatus::Error("missing bucket name in url " + url);
  }
  size_t end = path.find('/', start);
  config->bucket = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

  size_t path_start = url.find('/', url.find("://") + 3);
  config->endpoint = url.substr(0, path_start);
  if (config->region.empty()) {
    S3Region region;
    status = LookupRegionByEndpoint(config->endpoint, &region);
    if (!status.ok()) {
      return status;
    }
    config->region = region.name;
  }
  return IOStatus::OK();
}

IOStatus ParseListBucketResult(const std::string& xml, ObjectListing* listing) {
  try {
    pt::ptree tree;
    std::istringstream is(xml);
    pt::read_xml(is, tree);
    const pt::ptree& result = tree.get_child("ListBucketResult");
    for (auto& child : result) {
      if (child.first != "Contents") {
        continue;
      }
      ObjectInfo object;
      object.key = child.second.get<std::string>("Key");
      object.size = child.second.get<size_t>("Size", 0);
      listing->objects.push_back(object);
    }
    listing->truncated = result.get<bool>("IsTruncated", false);
    listing->next_marker = result.get<std::string>("NextMarker", "");
  } catch (const pt::ptree_error& e) {
    return IOStatus::Error(std::string("malformed ListBucketResult: ") + e.what());
  }
  if (listing->next_marker.empty() && !listing->objects.empty()) {
    listing->next_marker = listing->objects.back().key;
  }
  return IOStatus::OK();
}

IOStatus S3Client::Create(const S3Config& config, std::shared_ptr<S3Client>* client) {
  HttpEndpoint endpoint;
  IOStatus status = ParseEndpoint(config.endpoint, &endpoint, nullptr);
  if (!status.ok()) {
    return status;
  }
  if (config.bucket.empty()) {
    return IOStatus::Error("missing bucket name");
  }
  if (config.region.empty()) {
    return IOStatus::Error("missing region for endpoint " + config.endpoint);
  }
  if (config.credentials.access_key.empty() || config.credentials.secret_key.empty()) {
    return IOStatus::Error("missing S3 access key or secret key");
  }
  client->reset(new S3Client(config, endpoint));
  return IOStatus::OK();
}

std::string S3Client::ObjectTarget(const std::string& key) const {
  return "/" + config_.bucket + "/" + UriEncode(key, false);
}

IOStatus S3Client::ListObjects(const std::string& prefix, const std::string& marker,
                               ObjectListing* listing) {
  std::stringstream target;
  target << "/" << config_.bucket << "?";
  if (!marker.empty()) {
    target << "marker=" << UriEncode(marker, true) << "&";
  }
  target << "max-keys=" << config_.max_keys;
  if (!prefix.empty()) {
    target << "&prefix=" << UriEncode(prefix, true);
  }

  HttpRequest request;
  request.method = "GET";
  request.target = target.str();
  IOStatus status = signer_.Sign(http_.endpoint().HostHeader(), &request);
  if (!status.ok()) {
    return status;
  }
  HttpResponse response;
  status = http_.Send(request, &response);
  if (!status.ok()) {
    return status;
  }
  if (!response.IsSuccess()) {
    return IOStatus::Error(response.DebugString());
  }
  return ParseListBucketResult(response.body, listing);
}

IOStatus S3Client::GetObject(const std::string& key, std::unique_ptr<AbstractReader>* reader) {
  HttpRequest request;
  request.method = "GET";
  request.target = ObjectTarget(key);
  IOStatus status = signer_.Sign(http_.endpoint().HostHeader(), &request);
  if (!status.ok()) {
    return status;
  }
  return http_.Download(request, reader);
}

IOStatus S3Client::PutObject(const std::string& key, AbstractReader* content, size_t size,
                             const std::string& content_type) {
  HttpRequest request;
  request.method = "PUT";
  request.target = ObjectTarget(key);
  request.headers.emplace_back("Content-Type", content_type);
  request.headers.emplace_back("x-amz-acl", kBucketOwnerFull);
  request.headers.emplace_back("Content-Length", std::to_string(size));
  IOStatus status = signer_.Sign(http_.endpoint().HostHeader(), &request);
  if (!status.ok()) {
    return status;
  }
  HttpResponse response;
  status = http_.Upload(request, content, size, &response);
  if (!status.ok()) {
    return status;
  }
  if (!response.IsSuccess()) {
    return IOStatus::Error(response.DebugString());
  }
  return IOStatus::OK();
}

}  // namespace objcp
