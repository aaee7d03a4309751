#include "io/http/http_client.hpp"

#include <climits>
#include <cstdint>
#include <limits>

#include <openssl/err.h>

#include "boost/asio/ip/tcp.hpp"
#include "boost/asio/ssl/host_name_verification.hpp"
#include "boost/beast/core.hpp"
#include "boost/beast/http.hpp"
#include "boost/beast/ssl.hpp"
#include "glog/logging.h"

namespace objcp {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

const size_t kUploadChunkSize = 1 << 16;
const char kUserAgent[] = "objcp/1.0";

/*
 * One plain or TLS connection. Visit() hands whichever stream is open,
 * together with the read buffer, to a generic callable.
 */
class HttpConnection {
 public:
  explicit HttpConnection(const HttpEndpoint& endpoint)
      : endpoint_(endpoint), ssl_ctx_(ssl::context::tls_client) {}
  ~HttpConnection() { Close(); }
  HttpConnection(const HttpConnection&) = delete;
  HttpConnection& operator=(const HttpConnection&) = delete;

  beast::error_code Connect() {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
      return ec;
    }
    if (!endpoint_.IsSecure()) {
      plain_.reset(new beast::tcp_stream(ioc_));
      plain_->connect(results, ec);
      return ec;
    }

    ssl_ctx_.set_default_verify_paths(ec);
    if (ec) {
      return ec;
    }
    ssl_ctx_.set_verify_mode(ssl::verify_peer, ec);
    if (ec) {
      return ec;
    }
    ssl_ctx_.set_verify_callback(ssl::host_name_verification(endpoint_.host), ec);
    if (ec) {
      return ec;
    }
    tls_.reset(new beast::ssl_stream<beast::tcp_stream>(ioc_, ssl_ctx_));
    if (!SSL_set_tlsext_host_name(tls_->native_handle(), endpoint_.host.c_str())) {
      return beast::error_code(static_cast<int>(::ERR_get_error()),
                               net::error::get_ssl_category());
    }
    beast::get_lowest_layer(*tls_).connect(results, ec);
    if (ec) {
      return ec;
    }
    tls_->handshake(ssl::stream_base::client, ec);
    return ec;
  }

  template <class Op>
  beast::error_code Visit(Op&& op) {
    if (tls_) {
      return op(*tls_, buffer_);
    }
    CHECK(plain_) << "connection to " << endpoint_.DebugString() << " is not open";
    return op(*plain_, buffer_);
  }

  void Close() {
    beast::error_code ec;
    if (tls_) {
      beast::get_lowest_layer(*tls_).socket().shutdown(tcp::socket::shutdown_both, ec);
      tls_.reset();
    }
    if (plain_) {
      plain_->socket().shutdown(tcp::socket::shutdown_both, ec);
      plain_.reset();
    }
  }

 private:
  HttpEndpoint endpoint_;
  net::io_context ioc_;
  ssl::context ssl_ctx_;
  std::unique_ptr<beast::tcp_stream> plain_;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
  beast::flat_buffer buffer_;
};

using BodyParser = http::response_parser<http::buffer_body>;

/*
 * Streams a response body straight off the connection.
 */
class HttpBodyReader : public AbstractReader {
 public:
  HttpBodyReader(std::unique_ptr<HttpConnection> conn, std::unique_ptr<BodyParser> parser)
      : conn_(std::move(conn)), parser_(std::move(parser)) {}

  virtual int Read(void *buffer, size_t len) override {
    if (len > INT_MAX) {
      len = INT_MAX;
    }
    while (!parser_->is_done()) {
      parser_->get().body().data = buffer;
      parser_->get().body().size = len;
      beast::error_code ec = conn_->Visit([this](auto& stream, beast::flat_buffer& buf) {
        beast::error_code e;
        http::read(stream, buf, *parser_, e);
        return e;
      });
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        error_ = ec.message();
        return -1;
      }
      size_t nbytes = len - parser_->get().body().size;
      if (nbytes > 0) {
        return static_cast<int>(nbytes);
      }
    }
    return 0;
  }

  virtual std::string LastError() const override { return error_; }

 private:
  std::unique_ptr<HttpConnection> conn_;
  std::unique_ptr<BodyParser> parser_;
  std::string error_;
};

template <class Body>
void SetHeaders(const HttpRequest& request, const HttpEndpoint& endpoint,
                http::request<Body>* req) {
  req->set(http::field::host, endpoint.HostHeader());
  req->set(http::field::user_agent, kUserAgent);
  for (auto& header : request.headers) {
    req->set(header.first, header.second);
  }
}

http::verb ParseVerb(const std::string& method) {
  http::verb verb = http::string_to_verb(method);
  CHECK(verb != http::verb::unknown) << "unknown http method: " << method;
  return verb;
}

IOStatus NetworkError(const std::string& what, const HttpEndpoint& endpoint,
                      const beast::error_code& ec) {
  return IOStatus::Error(what + " " + endpoint.DebugString() + " failed: " + ec.message());
}

IOStatus ReadResponse(HttpConnection* conn, const HttpEndpoint& endpoint,
                      HttpResponse* response) {
  http::response<http::string_body> res;
  beast::error_code ec = conn->Visit([&res](auto& stream, beast::flat_buffer& buf) {
    beast::error_code e;
    http::read(stream, buf, res, e);
    return e;
  });
  if (ec) {
    return NetworkError("reading response from", endpoint, ec);
  }
  response->status = res.result_int();
  response->reason = res.reason().to_string();
  response->body = std::move(res.body());
  return IOStatus::OK();
}

}  // namespace

std::string HttpEndpoint::HostHeader() const {
  if ((IsSecure() && port == "443") || (!IsSecure() && port == "80")) {
    return host;
  }
  return host + ":" + port;
}

IOStatus ParseEndpoint(const std::string& url, HttpEndpoint* endpoint, std::string* path) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return IOStatus::Error("missing scheme in url " + url);
  }
  std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") {
    return IOStatus::Error("unsupported scheme " + scheme + " in url " + url);
  }
  size_t host_start = scheme_end + 3;
  size_t path_start = url.find('/', host_start);
  std::string authority = url.substr(host_start, path_start == std::string::npos
                                                     ? std::string::npos
                                                     : path_start - host_start);
  if (authority.empty()) {
    return IOStatus::Error("missing host in url " + url);
  }
  endpoint->scheme = scheme;
  size_t colon = authority.find(':');
  if (colon == std::string::npos) {
    endpoint->host = authority;
    endpoint->port = scheme == "https" ? "443" : "80";
  } else {
    endpoint->host = authority.substr(0, colon);
    endpoint->port = authority.substr(colon + 1);
    if (endpoint->host.empty() || endpoint->port.empty()) {
      return IOStatus::Error("malformed host in url " + url);
    }
  }
  if (path) {
    *path = path_start == std::string::npos ? "/" : url.substr(path_start);
  }
  return IOStatus::OK();
}

IOStatus HttpClient::Send(const HttpRequest& request, HttpResponse* response) {
  HttpConnection conn(endpoint_);
  beast::error_code ec = conn.Connect();
  if (ec) {
    return NetworkError("connecting to", endpoint_, ec);
  }

  http::request<http::string_body> req{ParseVerb(request.method), request.target, 11};
  SetHeaders(request, endpoint_, &req);
  req.body() = request.body;
  req.prepare_payload();
  VLOG(1) << request.method << " " << endpoint_.DebugString() << request.target;

  ec = conn.Visit([&req](auto& stream, beast::flat_buffer&) {
    beast::error_code e;
    http::write(stream, req, e);
    return e;
  });
  if (ec) {
    return NetworkError("sending request to", endpoint_, ec);
  }
  return ReadResponse(&conn, endpoint_, response);
}

IOStatus HttpClient::Upload(const HttpRequest& request, AbstractReader* content, size_t size,
                            HttpResponse* response) {
  CHECK(content);
  HttpConnection conn(endpoint_);
  beast::error_code ec = conn.Connect();
  if (ec) {
    return NetworkError("connecting to", endpoint_, ec);
  }

  http::request<http::buffer_body> req{ParseVerb(request.method), request.target, 11};
  SetHeaders(request, endpoint_, &req);
  req.content_length(size);
  req.body().data = nullptr;
  req.body().more = true;
  VLOG(1) << request.method << " " << endpoint_.DebugString() << request.target
          << " (" << size << " bytes)";

  http::request_serializer<http::buffer_body> sr{req};
  ec = conn.Visit([&sr](auto& stream, beast::flat_buffer&) {
    beast::error_code e;
    http::write_header(stream, sr, e);
    return e;
  });
  if (ec) {
    return NetworkError("sending request to", endpoint_, ec);
  }

  std::vector<char> buffer(kUploadChunkSize);
  size_t sent = 0;
  do {
    int nbytes = content->Read(buffer.data(), buffer.size());
    if (nbytes < 0) {
      return IOStatus::Error("reading content failed: " + content->LastError());
    }
    if (nbytes == 0) {
      req.body().data = nullptr;
      req.body().size = 0;
      req.body().more = false;
    } else {
      sent += nbytes;
      if (sent > size) {
        return IOStatus::Error("content is longer than the declared " +
                               std::to_string(size) + " bytes");
      }
      req.body().data = buffer.data();
      req.body().size = nbytes;
      req.body().more = true;
    }
    ec = conn.Visit([&sr](auto& stream, beast::flat_buffer&) {
      beast::error_code e;
      http::write(stream, sr, e);
      return e;
    });
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      return NetworkError("sending body to", endpoint_, ec);
    }
  } while (!sr.is_done());

  if (sent != size) {
    return IOStatus::Error("content is " + std::to_string(sent) + " bytes, declared " +
                           std::to_string(size));
  }
  return ReadResponse(&conn, endpoint_, response);
}

IOStatus HttpClient::Download(const HttpRequest& request, std::unique_ptr<AbstractReader>* reader,
                              size_t* content_length) {
  std::unique_ptr<HttpConnection> conn(new HttpConnection(endpoint_));
  beast::error_code ec = conn->Connect();
  if (ec) {
    return NetworkError("connecting to", endpoint_, ec);
  }

  http::request<http::string_body> req{ParseVerb(request.method), request.target, 11};
  SetHeaders(request, endpoint_, &req);
  req.prepare_payload();
  VLOG(1) << request.method << " " << endpoint_.DebugString() << request.target;
  ec = conn->Visit([&req](auto& stream, beast::flat_buffer&) {
    beast::error_code e;
    http::write(stream, req, e);
    return e;
  });
  if (ec) {
    return NetworkError("sending request to", endpoint_, ec);
  }

  std::unique_ptr<BodyParser> parser(new BodyParser);
  parser->body_limit(std::numeric_limits<std::uint64_t>::max());
  ec = conn->Visit([&parser](auto& stream, beast::flat_buffer& buf) {
    beast::error_code e;
    http::read_header(stream, buf, *parser, e);
    return e;
  });
  if (ec) {
    return NetworkError("reading response from", endpoint_, ec);
  }
  int status = parser->get().result_int();
  if (status / 100 != 2) {
    return IOStatus::Error("HTTP " + std::to_string(status) + " " +
                           parser->get().reason().to_string());
  }
  if (content_length) {
    *content_length = parser->content_length() ? *parser->content_length() : 0;
  }
  reader->reset(new HttpBodyReader(std::move(conn), std::move(parser)));
  return IOStatus::OK();
}

std::string UriEncode(const std::string& input, bool encode_slash) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string output;
  output.reserve(input.size());
  for (unsigned char c : input) {
    if (('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z') || ('0' <= c && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
      output += static_cast<char>(c);
    } else {
      output += '%';
      output += kHex[c >> 4];
      output += kHex[c & 0x0f];
    }
  }
  return output;
}

}  // namespace objcp
