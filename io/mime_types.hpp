#pragma once

#include <string>

namespace objcp {

const char kDefaultMimeType[] = "application/octet-stream";

// Content type for the extension of path, kDefaultMimeType when unknown.
std::string MimeTypeByExtension(const std::string& path);

}  // namespace objcp
