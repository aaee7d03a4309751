#pragma once

#include <string>

#include "io/http/http_client.hpp"
#include "io/io_status.hpp"

namespace objcp {

struct S3Credentials {
  std::string access_key;
  std::string secret_key;
};

const char kUnsignedPayload[] = "UNSIGNED-PAYLOAD";

/*
 * AWS Signature Version 4 for S3 requests.
 *
 * The request target must already be URI encoded. Sign() adds the
 * x-amz-date, x-amz-content-sha256 (unless present) and Authorization headers.
 */
class S3Signer {
 public:
  S3Signer(S3Credentials credentials, std::string region, std::string service = "s3")
      : credentials_(std::move(credentials)), region_(std::move(region)),
        service_(std::move(service)) {}

  IOStatus Sign(const std::string& host, HttpRequest* request) const;
  // amz_date has the form YYYYMMDD'T'HHMMSS'Z'.
  IOStatus SignAt(const std::string& host, const std::string& amz_date,
                  HttpRequest* request) const;

 private:
  S3Credentials credentials_;
  std::string region_;
  std::string service_;
};

std::string Sha256Hex(const std::string& data);

}  // namespace objcp
