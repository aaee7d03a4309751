#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "io/abstract_reader.hpp"
#include "io/io_status.hpp"

namespace objcp {

struct ObjectInfo {
  std::string key;
  size_t size;
};

struct ObjectListing {
  std::vector<ObjectInfo> objects;
  // true when more pages follow next_marker
  bool truncated = false;
  std::string next_marker;

  std::string DebugString() const {
    std::stringstream ss;
    ss << "{ # of objects: " << objects.size() << ", truncated: " << truncated
       << ", next_marker: " << next_marker << " }";
    return ss.str();
  }
};

/*
 * Wire-level access to one bucket of an object store.
 * Implementations must be safe to call from several threads at once.
 */
class AbstractObjectClient {
 public:
  virtual ~AbstractObjectClient() {}

  // One page of keys starting with prefix, in ascending key order, after marker.
  virtual IOStatus ListObjects(const std::string& prefix, const std::string& marker,
                               ObjectListing* listing) = 0;
  virtual IOStatus GetObject(const std::string& key,
                             std::unique_ptr<AbstractReader>* reader) = 0;
  virtual IOStatus PutObject(const std::string& key, AbstractReader* content,
                             size_t size, const std::string& content_type) = 0;
  // Name used in log lines.
  virtual std::string Name() const = 0;
};

}  // namespace objcp
