#include "io/s3/s3_signer.hpp"

#include <time.h>

#include <algorithm>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include "boost/algorithm/string.hpp"
#include "glog/logging.h"

namespace objcp {

namespace {

std::string ToHex(const unsigned char* digest, size_t len) {
  static const char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    hex += kHex[digest[i] >> 4];
    hex += kHex[digest[i] & 0x0f];
  }
  return hex;
}

bool HmacSha256(const std::string& key, const std::string& data, std::string* mac) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest,
           &len) == nullptr) {
    return false;
  }
  mac->assign(reinterpret_cast<const char*>(digest), len);
  return true;
}

// Sort "a=1&b=2" by parameter name; a bare "acl" becomes "acl=".
std::string CanonicalQuery(const std::string& query) {
  std::vector<std::pair<std::string, std::string>> params;
  std::vector<std::string> parts;
  boost::algorithm::split(parts, query, boost::is_any_of("&"));
  for (auto& part : parts) {
    if (part.empty()) {
      continue;
    }
    size_t eq = part.find('=');
    if (eq == std::string::npos) {
      params.emplace_back(part, "");
    } else {
      params.emplace_back(part.substr(0, eq), part.substr(eq + 1));
    }
  }
  std::sort(params.begin(), params.end());
  std::string canonical;
  for (auto& param : params) {
    if (!canonical.empty()) {
      canonical += '&';
    }
    canonical += param.first + "=" + param.second;
  }
  return canonical;
}

// Trim and collapse internal runs of spaces.
std::string CanonicalHeaderValue(const std::string& value) {
  std::string trimmed = boost::algorithm::trim_copy(value);
  std::string collapsed;
  collapsed.reserve(trimmed.size());
  for (char c : trimmed) {
    if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') {
      continue;
    }
    collapsed += c;
  }
  return collapsed;
}

}  // namespace

std::string Sha256Hex(const std::string& data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
  return ToHex(digest, SHA256_DIGEST_LENGTH);
}

IOStatus S3Signer::Sign(const std::string& host, HttpRequest* request) const {
  time_t now = time(nullptr);
  struct tm utc;
  gmtime_r(&now, &utc);
  char amz_date[sizeof("YYYYMMDDThhmmssZ")];
  strftime(amz_date, sizeof(amz_date), "%Y%m%dT%H%M%SZ", &utc);
  return SignAt(host, amz_date, request);
}

IOStatus S3Signer::SignAt(const std::string& host, const std::string& amz_date,
                          HttpRequest* request) const {
  if (amz_date.size() != 16 || amz_date[8] != 'T') {
    return IOStatus::Error("invalid x-amz-date " + amz_date);
  }
  if (credentials_.access_key.empty() || credentials_.secret_key.empty()) {
    return IOStatus::Error("missing S3 credentials");
  }
  std::string date = amz_date.substr(0, 8);

  std::string payload_hash;
  for (auto& header : request->headers) {
    if (boost::algorithm::iequals(header.first, "x-amz-content-sha256")) {
      payload_hash = header.second;
    }
  }
  if (payload_hash.empty()) {
    payload_hash = kUnsignedPayload;
    request->headers.emplace_back("x-amz-content-sha256", payload_hash);
  }
  request->headers.emplace_back("x-amz-date", amz_date);

  std::vector<std::pair<std::string, std::string>> headers;
  headers.emplace_back("host", host);
  for (auto& header : request->headers) {
    headers.emplace_back(boost::algorithm::to_lower_copy(header.first),
                         CanonicalHeaderValue(header.second));
  }
  std::sort(headers.begin(), headers.end());

  std::string canonical_headers;
  std::string signed_headers;
  for (auto& header : headers) {
    canonical_headers += header.first + ":" + header.second + "\n";
    if (!signed_headers.empty()) {
      signed_headers += ';';
    }
    signed_headers += header.first;
  }

  std::string path = request->target;
  std::string query;
  size_t question = path.find('?');
  if (question != std::string::npos) {
    query = path.substr(question + 1);
    path = path.substr(0, question);
  }

  std::string canonical_request = request->method + "\n" + path + "\n" +
                                  CanonicalQuery(query) + "\n" + canonical_headers + "\n" +
                                  signed_headers + "\n" + payload_hash;
  std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";
  std::string string_to_sign = std::string("AWS4-HMAC-SHA256\n") + amz_date + "\n" + scope +
                               "\n" + Sha256Hex(canonical_request);
  VLOG(2) << "canonical request:\n" << canonical_request;

  std::string key;
  if (!HmacSha256("AWS4" + credentials_.secret_key, date, &key) ||
      !HmacSha256(key, region_, &key) || !HmacSha256(key, service_, &key) ||
      !HmacSha256(key, "aws4_request", &key)) {
    return IOStatus::Error("unable to derive signing key");
  }
  std::string signature;
  if (!HmacSha256(key, string_to_sign, &signature)) {
    return IOStatus::Error("unable to sign request");
  }

  request->headers.emplace_back(
      "Authorization",
      "AWS4-HMAC-SHA256 Credential=" + credentials_.access_key + "/" + scope +
          ",SignedHeaders=" + signed_headers + ",Signature=" +
          ToHex(reinterpret_cast<const unsigned char*>(signature.data()), signature.size()));
  return IOStatus::OK();
}

}  // namespace objcp
