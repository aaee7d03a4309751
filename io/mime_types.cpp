#include "io/mime_types.hpp"

#include <map>

#include "boost/algorithm/string.hpp"

namespace objcp {

namespace {

const std::map<std::string, std::string>& MimeTable() {
  static const std::map<std::string, std::string> table{
      {".css", "text/css; charset=utf-8"},
      {".csv", "text/csv; charset=utf-8"},
      {".gif", "image/gif"},
      {".gz", "application/gzip"},
      {".htm", "text/html; charset=utf-8"},
      {".html", "text/html; charset=utf-8"},
      {".jpeg", "image/jpeg"},
      {".jpg", "image/jpeg"},
      {".js", "text/javascript; charset=utf-8"},
      {".json", "application/json"},
      {".mp3", "audio/mpeg"},
      {".mp4", "video/mp4"},
      {".pdf", "application/pdf"},
      {".png", "image/png"},
      {".svg", "image/svg+xml"},
      {".tar", "application/x-tar"},
      {".txt", "text/plain; charset=utf-8"},
      {".wasm", "application/wasm"},
      {".webp", "image/webp"},
      {".xml", "text/xml; charset=utf-8"},
      {".zip", "application/zip"},
  };
  return table;
}

}  // namespace

std::string MimeTypeByExtension(const std::string& path) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return kDefaultMimeType;
  }
  std::string ext = boost::algorithm::to_lower_copy(path.substr(dot));
  auto it = MimeTable().find(ext);
  if (it == MimeTable().end()) {
    return kDefaultMimeType;
  }
  return it->second;
}

}  // namespace objcp
