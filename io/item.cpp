#include "io/item.hpp"

#include "glog/logging.h"

namespace objcp {

std::string Item::RelativePath() const {
  CHECK_EQ(path.compare(0, prefix.size(), prefix), 0)
      << "path " << path << " is not under prefix " << prefix;
  size_t start = prefix.size();
  while (start < path.size() && path[start] == '/') {
    ++start;
  }
  return path.substr(start);
}

std::string JoinPath(const std::string& prefix, const std::string& relative) {
  if (prefix.empty()) {
    return relative;
  }
  size_t end = prefix.size();
  while (end > 1 && prefix[end - 1] == '/') {
    --end;
  }
  std::string joined = prefix.substr(0, end);
  if (relative.empty()) {
    return joined;
  }
  if (joined != "/") {
    joined += '/';
  }
  return joined + relative;
}

}  // namespace objcp
