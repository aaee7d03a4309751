#include "io/gcs/gcs_client.hpp"

#include <sstream>

#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"
#include "glog/logging.h"

namespace objcp {

namespace pt = boost::property_tree;

IOStatus ParseObjectList(const std::string& json, ObjectListing* listing) {
  try {
    pt::ptree tree;
    std::istringstream is(json);
    pt::read_json(is, tree);
    auto items = tree.get_child_optional("items");
    if (items) {
      for (auto& child : *items) {
        ObjectInfo object;
        object.key = child.second.get<std::string>("name");
        object.size = child.second.get<size_t>("size", 0);
        listing->objects.push_back(object);
      }
    }
    listing->next_marker = tree.get<std::string>("nextPageToken", "");
  } catch (const pt::ptree_error& e) {
    return IOStatus::Error(std::string("malformed object list: ") + e.what());
  }
  listing->truncated = !listing->next_marker.empty();
  return IOStatus::OK();
}

IOStatus GcsClient::Create(const GcsConfig& config, std::shared_ptr<GcsClient>* client) {
  HttpEndpoint endpoint;
  IOStatus status = ParseEndpoint(config.endpoint, &endpoint, nullptr);
  if (!status.ok()) {
    return status;
  }
  if (config.bucket.empty()) {
    return IOStatus::Error("missing bucket name");
  }
  if (config.access_token.empty()) {
    return IOStatus::Error("missing GCS access token");
  }
  client->reset(new GcsClient(config, endpoint));
  return IOStatus::OK();
}

void GcsClient::Authorize(HttpRequest* request) const {
  request->headers.emplace_back("Authorization", "Bearer " + config_.access_token);
}

IOStatus GcsClient::ListObjects(const std::string& prefix, const std::string& marker,
                                ObjectListing* listing) {
  std::stringstream target;
  target << "/storage/v1/b/" << UriEncode(config_.bucket, true)
         << "/o?maxResults=" << config_.max_results;
  if (!prefix.empty()) {
    target << "&prefix=" << UriEncode(prefix, true);
  }
  if (!marker.empty()) {
    target << "&pageToken=" << UriEncode(marker, true);
  }

  HttpRequest request;
  request.method = "GET";
  request.target = target.str();
  Authorize(&request);
  HttpResponse response;
  IOStatus status = http_.Send(request, &response);
  if (!status.ok()) {
    return status;
  }
  if (!response.IsSuccess()) {
    return IOStatus::Error(response.DebugString());
  }
  return ParseObjectList(response.body, listing);
}

IOStatus GcsClient::GetObject(const std::string& key, std::unique_ptr<AbstractReader>* reader) {
  HttpRequest request;
  request.method = "GET";
  request.target = "/storage/v1/b/" + UriEncode(config_.bucket, true) + "/o/" +
                   UriEncode(key, true) + "?alt=media";
  Authorize(&request);
  return http_.Download(request, reader);
}

IOStatus GcsClient::PutObject(const std::string& key, AbstractReader* content, size_t size,
                              const std::string& content_type) {
  HttpRequest request;
  request.method = "POST";
  request.target = "/upload/storage/v1/b/" + UriEncode(config_.bucket, true) +
                   "/o?uploadType=media&name=" + UriEncode(key, true);
  request.headers.emplace_back("Content-Type", content_type);
  Authorize(&request);
  HttpResponse response;
  IOStatus status = http_.Upload(request, content, size, &response);
  if (!status.ok()) {
    return status;
  }
  if (!response.IsSuccess()) {
    return IOStatus::Error(response.DebugString());
  }
  VLOG(1) << "Inserted " << key << " into " << Name();
  return IOStatus::OK();
}

}  // namespace objcp
