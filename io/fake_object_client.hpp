#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "io/abstract_object_client.hpp"
#include "io/fake_reader.hpp"

namespace objcp {

/*
 * A bucket kept in a sorted map, listed page_size keys at a time.
 */
struct FakeObjectClient : public AbstractObjectClient {
  virtual IOStatus ListObjects(const std::string& prefix, const std::string& marker,
                               ObjectListing* listing) override {
    std::lock_guard<std::mutex> lk(mu);
    markers.push_back(marker);
    if (fail_listing_after >= 0 && static_cast<int>(markers.size()) > fail_listing_after) {
      return IOStatus::Error("injected listing failure");
    }
    auto it = marker.empty() ? objects.begin() : objects.upper_bound(marker);
    for (; it != objects.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) {
        continue;
      }
      if (static_cast<int>(listing->objects.size()) == page_size) {
        listing->truncated = true;
        break;
      }
      listing->objects.push_back(ObjectInfo{it->first, it->second.size()});
    }
    if (listing->truncated) {
      listing->next_marker = listing->objects.back().key;
    }
    return IOStatus::OK();
  }

  virtual IOStatus GetObject(const std::string& key,
                             std::unique_ptr<AbstractReader>* reader) override {
    std::lock_guard<std::mutex> lk(mu);
    if (unreadable.count(key)) {
      return IOStatus::Error("injected open failure");
    }
    reader->reset(new FakeReader(objects.at(key)));
    return IOStatus::OK();
  }

  virtual IOStatus PutObject(const std::string& key, AbstractReader* content, size_t size,
                             const std::string& content_type) override {
    std::string data;
    char buffer[64];
    int n;
    while ((n = content->Read(buffer, sizeof(buffer))) > 0) {
      data.append(buffer, n);
    }
    if (n < 0) {
      return IOStatus::Error(content->LastError());
    }
    std::lock_guard<std::mutex> lk(mu);
    objects[key] = data;
    content_types[key] = content_type;
    declared_sizes[key] = size;
    return IOStatus::OK();
  }

  virtual std::string Name() const override { return "fake://bucket"; }

  int page_size = 1000;
  // fail every listing call after this many, -1 for never
  int fail_listing_after = -1;
  std::set<std::string> unreadable;

  std::mutex mu;
  std::map<std::string, std::string> objects;
  std::map<std::string, std::string> content_types;
  std::map<std::string, size_t> declared_sizes;
  std::vector<std::string> markers;
};

}  // namespace objcp
