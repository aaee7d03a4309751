#include "io/s3/s3_regions.hpp"

#include <vector>

namespace objcp {

namespace {

const std::vector<S3Region>& Regions() {
  static const std::vector<S3Region> regions{
      {"us-east-1", "https://s3.amazonaws.com"},
      {"us-west-1", "https://s3-us-west-1.amazonaws.com"},
      {"us-west-2", "https://s3-us-west-2.amazonaws.com"},
      {"eu-west-1", "https://s3-eu-west-1.amazonaws.com"},
      {"ap-southeast-1", "https://s3-ap-southeast-1.amazonaws.com"},
      {"ap-southeast-2", "https://s3-ap-southeast-2.amazonaws.com"},
      {"ap-northeast-1", "https://s3-ap-northeast-1.amazonaws.com"},
      {"sa-east-1", "https://s3-sa-east-1.amazonaws.com"},
      {"us-gov-west-1", "https://s3-fips-us-gov-west-1.amazonaws.com"},
      {"cn-north-1", "https://s3.cn-north-1.amazonaws.com.cn"},
  };
  return regions;
}

}  // namespace

IOStatus LookupRegionByEndpoint(const std::string& endpoint, S3Region* region) {
  for (auto& r : Regions()) {
    if (r.endpoint == endpoint) {
      *region = r;
      return IOStatus::OK();
    }
  }
  return IOStatus::Error("Unknown region endpoint " + endpoint);
}

}  // namespace objcp
