#pragma once

#include <memory>
#include <sstream>
#include <string>

#include "io/abstract_reader.hpp"

namespace objcp {

/*
 * One transferable unit: a file or an object plus its byte stream.
 *
 * path always starts with prefix. The part of path after prefix is what
 * gets reproduced at the destination. Item is move-only; whoever holds it
 * last releases content.
 */
struct Item {
  std::string prefix;
  std::string path;
  // Advisory, used as upload metadata.
  size_t size = 0;
  std::unique_ptr<AbstractReader> content;

  Item() = default;
  Item(std::string prefix, std::string path, size_t size,
       std::unique_ptr<AbstractReader> content)
      : prefix(std::move(prefix)), path(std::move(path)), size(size),
        content(std::move(content)) {}
  Item(Item&&) = default;
  Item& operator=(Item&&) = default;

  // path without prefix and without leading separators
  std::string RelativePath() const;

  void Release() { content.reset(); }

  std::string DebugString() const {
    std::stringstream ss;
    ss << "(Prefix: " << prefix << ") " << path;
    return ss.str();
  }
};

// Join a destination prefix and a relative path with exactly one '/'.
// An empty prefix yields the relative path unchanged.
std::string JoinPath(const std::string& prefix, const std::string& relative);

}  // namespace objcp
