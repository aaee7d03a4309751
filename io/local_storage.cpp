#include "io/local_storage.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <vector>

#include "boost/filesystem.hpp"
#include "glog/logging.h"

#include "io/file_reader.hpp"

namespace objcp {

namespace fs = boost::filesystem;

namespace {

const size_t kCopyBufferSize = 1 << 16;

// Return false when the stream was cancelled.
bool PushFile(const fs::path& prefix, const fs::path& file, ItemStream* stream) {
  boost::system::error_code ec;
  uintmax_t size = fs::file_size(file, ec);
  if (ec) {
    LOG(WARNING) << "Could not stat " << file.string() << ": " << ec.message();
    return true;
  }
  std::unique_ptr<FileReader> reader;
  IOStatus status = FileReader::Open(file.string(), &reader);
  if (!status.ok()) {
    LOG(WARNING) << "Could not open " << file.string() << ": " << status.message();
    return true;
  }
  return stream->Push(Item(prefix.string(), file.string(), size, std::move(reader)));
}

IOStatus WriteAll(int fd, const char* data, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IOStatus::Error(strerror(errno));
    }
    data += n;
    len -= n;
  }
  return IOStatus::OK();
}

// Place relative under root. Only plain descending names are accepted.
IOStatus ResolveTarget(const fs::path& root, const std::string& relative, fs::path* target) {
  if (relative.empty() || relative.back() == '/') {
    return IOStatus::Error("'" + relative + "' does not name a file");
  }
  fs::path rel(relative);
  if (rel.has_root_path()) {
    return IOStatus::Error("'" + relative + "' is not a relative path");
  }
  for (auto& part : rel) {
    if (part == "..") {
      return IOStatus::Error("'" + relative + "' leaves the destination root");
    }
  }
  rel = rel.lexically_normal();
  if (rel.empty() || rel.filename() == ".") {
    return IOStatus::Error("'" + relative + "' does not name a file");
  }
  *target = root / rel;
  return IOStatus::OK();
}

}  // namespace

void WalkLocalRoot(const std::string& root, ItemStream* stream) {
  boost::system::error_code ec;
  fs::path abs_root = fs::absolute(fs::path(root), ec);
  if (ec) {
    LOG(ERROR) << "Could not resolve " << root << ": " << ec.message();
    return;
  }
  fs::file_status st = fs::status(abs_root, ec);
  if (ec || !fs::exists(st)) {
    LOG(ERROR) << "Could not open " << abs_root.string() << ": "
               << (ec ? ec.message() : "no such file or directory");
    return;
  }
  if (!fs::is_directory(st)) {
    // a single file is copied under its own base name
    PushFile(abs_root.parent_path(), abs_root, stream);
    return;
  }

  LOG(INFO) << "Traversing " << abs_root.string() << "...";
  fs::recursive_directory_iterator it(abs_root, ec), end;
  if (ec) {
    LOG(ERROR) << "Could not open " << abs_root.string() << ": " << ec.message();
    return;
  }
  while (it != end) {
    const fs::path& path = it->path();
    fs::file_status entry_status = it->status(ec);
    if (ec) {
      LOG(WARNING) << "Could not stat " << path.string() << ": " << ec.message();
    } else if (fs::is_regular_file(entry_status)) {
      if (!PushFile(abs_root, path, stream)) {
        return;
      }
    } else if (fs::is_directory(entry_status)) {
      fs::directory_iterator dir_check(path, ec);
      if (ec) {
        LOG(WARNING) << "Skipping unreadable directory " << path.string() << ": "
                     << ec.message();
        it.disable_recursion_pending();
      }
    } else {
      VLOG(1) << "Skipping special file " << path.string();
    }
    it.increment(ec);
    if (ec) {
      LOG(ERROR) << "Traversal of " << abs_root.string() << " stopped: " << ec.message();
      return;
    }
  }
}

std::shared_ptr<ItemStream> LocalStorage::ListFiles() {
  std::string root = root_;
  return ItemStream::Spawn([root](ItemStream* stream) { WalkLocalRoot(root, stream); });
}

IOStatus LocalStorage::PutFile(Item item) {
  if (!item.content) {
    return IOStatus::Error("item " + item.path + " has no content");
  }
  fs::path target;
  IOStatus resolved = ResolveTarget(fs::path(root_), item.RelativePath(), &target);
  if (!resolved.ok()) {
    return IOStatus::Error("cannot place " + item.path + " under " + root_ + ": " +
                           resolved.message());
  }

  boost::system::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return IOStatus::Error("cannot create directory " + target.parent_path().string() +
                           ": " + ec.message());
  }

  int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return IOStatus::Error("cannot create " + target.string() + ": " + strerror(errno));
  }

  IOStatus status;
  std::vector<char> buffer(kCopyBufferSize);
  for (;;) {
    int n = item.content->Read(buffer.data(), buffer.size());
    if (n < 0) {
      status = IOStatus::Error("reading " + item.path + " failed: " + item.content->LastError());
      break;
    }
    if (n == 0) {
      break;
    }
    status = WriteAll(fd, buffer.data(), n);
    if (!status.ok()) {
      status = IOStatus::Error("writing " + target.string() + " failed: " + status.message());
      break;
    }
  }
  item.Release();

  if (::close(fd) != 0 && status.ok()) {
    status = IOStatus::Error("closing " + target.string() + " failed: " + strerror(errno));
  }
  return status;
}

}  // namespace objcp
