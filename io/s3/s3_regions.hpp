#pragma once

#include <string>

#include "io/io_status.hpp"

namespace objcp {

struct S3Region {
  std::string name;
  std::string endpoint;
};

// Find the known AWS region served by endpoint (scheme://host).
IOStatus LookupRegionByEndpoint(const std::string& endpoint, S3Region* region);

}  // namespace objcp
