#include "io/object_storage.hpp"

#include "glog/logging.h"

#include "io/mime_types.hpp"

namespace objcp {

namespace {

// Folder placeholders such as "backup/" carry no file content.
bool IsDirectoryMarker(const std::string& prefix, const std::string& key) {
  if (!key.empty() && key.back() == '/') {
    return true;
  }
  return key.find_first_not_of('/', prefix.size()) == std::string::npos;
}

}  // namespace

void ListBucket(std::shared_ptr<AbstractObjectClient> client, const std::string& prefix,
                ItemStream* stream) {
  std::string marker;
  int num_pages = 0;
  for (;;) {
    ObjectListing listing;
    IOStatus status = client->ListObjects(prefix, marker, &listing);
    if (!status.ok()) {
      LOG(ERROR) << "Could not list items in bucket " << client->Name() << ": "
                 << status.message();
      return;
    }
    num_pages += 1;
    VLOG(1) << "Listed page " << num_pages << " of " << client->Name() << ": "
            << listing.DebugString();
    for (auto& object : listing.objects) {
      if (IsDirectoryMarker(prefix, object.key)) {
        LOG(INFO) << "Skipping directory marker " << object.key;
        continue;
      }
      std::unique_ptr<AbstractReader> reader;
      status = client->GetObject(object.key, &reader);
      if (!status.ok()) {
        LOG(WARNING) << "Could not receive " << object.key << ": " << status.message();
        continue;
      }
      if (!stream->Push(Item(prefix, object.key, object.size, std::move(reader)))) {
        return;
      }
    }
    if (!listing.truncated) {
      break;
    }
    if (listing.next_marker.empty() || listing.next_marker == marker) {
      LOG(ERROR) << "Listing of " << client->Name() << " does not advance past marker '"
                 << marker << "', stopping";
      return;
    }
    marker = listing.next_marker;
  }
}

std::shared_ptr<ItemStream> ObjectStorage::ListFiles() {
  auto client = client_;
  std::string prefix = prefix_;
  return ItemStream::Spawn(
      [client, prefix](ItemStream* stream) { ListBucket(client, prefix, stream); });
}

IOStatus ObjectStorage::PutFile(Item item) {
  if (!item.content) {
    return IOStatus::Error("item " + item.path + " has no content");
  }
  std::string key = JoinPath(prefix_, item.RelativePath());
  IOStatus status = client_->PutObject(key, item.content.get(), item.size,
                                       MimeTypeByExtension(item.path));
  item.Release();
  if (!status.ok()) {
    return IOStatus::Error("uploading " + key + " to " + client_->Name() +
                           " failed: " + status.message());
  }
  return status;
}

}  // namespace objcp
