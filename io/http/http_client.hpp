#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "io/abstract_reader.hpp"
#include "io/io_status.hpp"

namespace objcp {

struct HttpEndpoint {
  std::string scheme;
  std::string host;
  std::string port;

  bool IsSecure() const { return scheme == "https"; }
  // host, plus the port when it is not the scheme's default
  std::string HostHeader() const;

  std::string DebugString() const {
    std::stringstream ss;
    ss << scheme << "://" << host << ":" << port;
    return ss.str();
  }
};

// Split "scheme://host[:port]/rest" into endpoint and "/rest".
IOStatus ParseEndpoint(const std::string& url, HttpEndpoint* endpoint, std::string* path);

struct HttpRequest {
  std::string method;
  // origin-form target: path plus optional query string
  std::string target;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  std::string body;

  bool IsSuccess() const { return status >= 200 && status < 300; }
  std::string DebugString() const {
    std::stringstream ss;
    ss << "HTTP " << status << " " << reason;
    if (!body.empty()) {
      ss << ": " << body.substr(0, 512);
    }
    return ss.str();
  }
};

/*
 * Blocking HTTP/1.1 client for one endpoint. Every call opens its own
 * connection, so a single client is safe to share between threads.
 */
class HttpClient {
 public:
  explicit HttpClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

  const HttpEndpoint& endpoint() const { return endpoint_; }

  // Send request with request.body and read the whole response.
  IOStatus Send(const HttpRequest& request, HttpResponse* response);

  // Stream exactly size bytes of content as the request body.
  IOStatus Upload(const HttpRequest& request, AbstractReader* content, size_t size,
                  HttpResponse* response);

  // Send request and hand the response body out as a stream. Fails unless
  // the server answers 2xx.
  IOStatus Download(const HttpRequest& request, std::unique_ptr<AbstractReader>* reader,
                    size_t* content_length = nullptr);

 private:
  HttpEndpoint endpoint_;
};

// Percent-encode everything except unreserved characters, and '/' unless
// encode_slash is set.
std::string UriEncode(const std::string& input, bool encode_slash);

}  // namespace objcp
