#include <cstdlib>
#include <memory>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "core/copy_engine.hpp"
#include "io/gcs/gcs_storage.hpp"
#include "io/local_storage.hpp"
#include "io/s3/s3_storage.hpp"

DEFINE_string(backend, "s3", "Object store to copy to or from: s3 or gcs");
DEFINE_string(bucket_url, "", "S3 bucket url, e.g. https://s3-us-west-1.amazonaws.com/bucket");
DEFINE_string(region, "", "S3 region name; required for endpoints outside the region table");
DEFINE_string(access_key, "", "AWS access key id (default: $AWS_ACCESS_KEY_ID)");
DEFINE_string(secret_key, "", "AWS secret access key (default: $AWS_SECRET_ACCESS_KEY)");
DEFINE_string(gcs_bucket, "", "GCS bucket name");
DEFINE_string(gcs_endpoint, objcp::kGcsDefaultEndpoint, "GCS JSON API endpoint");
DEFINE_string(gcs_token, "", "GCS OAuth2 access token (default: $GCS_ACCESS_TOKEN)");
DEFINE_string(prefix, "", "Key prefix: prepended to uploaded items, filters downloaded items");
DEFINE_int32(concurrency, objcp::kDefaultConcurrency, "Number of concurrent transfers");
DEFINE_bool(continue_on_error, false, "Log failed transfers and go on instead of aborting");

namespace objcp {

namespace {

std::string FlagOrEnv(const std::string& flag, const char* env) {
  if (!flag.empty()) {
    return flag;
  }
  const char* value = std::getenv(env);
  return value ? value : "";
}

std::shared_ptr<AbstractStorage> MakeObjectStorage() {
  if (FLAGS_backend == "s3") {
    S3Config config;
    config.region = FLAGS_region;
    config.prefix = FLAGS_prefix;
    config.credentials.access_key = FlagOrEnv(FLAGS_access_key, "AWS_ACCESS_KEY_ID");
    config.credentials.secret_key = FlagOrEnv(FLAGS_secret_key, "AWS_SECRET_ACCESS_KEY");
    IOStatus status = ParseS3BucketUrl(FLAGS_bucket_url, &config);
    CHECK(status.ok()) << status.message();
    std::shared_ptr<S3Storage> storage;
    status = S3Storage::Create(config, &storage);
    CHECK(status.ok()) << status.message();
    return storage;
  }
  if (FLAGS_backend == "gcs") {
    GcsConfig config;
    config.endpoint = FLAGS_gcs_endpoint;
    config.bucket = FLAGS_gcs_bucket;
    config.prefix = FLAGS_prefix;
    config.access_token = FlagOrEnv(FLAGS_gcs_token, "GCS_ACCESS_TOKEN");
    std::shared_ptr<GcsStorage> storage;
    IOStatus status = GcsStorage::Create(config, &storage);
    CHECK(status.ok()) << status.message();
    return storage;
  }
  LOG(FATAL) << "unknown backend: " << FLAGS_backend;
  return nullptr;
}

void Run(const std::string& verb, const std::string& local_path) {
  CHECK_GE(FLAGS_concurrency, 1) << "--concurrency must be positive";
  auto remote = MakeObjectStorage();
  auto local = std::make_shared<LocalStorage>(local_path);

  if (verb == "put") {
    Copy(remote, local->ListFiles(), FLAGS_concurrency, FLAGS_continue_on_error);
  } else if (verb == "get") {
    Copy(local, remote->ListFiles(), FLAGS_concurrency, FLAGS_continue_on_error);
  } else {
    LOG(FATAL) << "unknown verb: " << verb << ", expected put or get";
  }
}

}  // namespace
}  // namespace objcp

int main(int argc, char** argv) {
  gflags::SetUsageMessage("objcp [flags] put|get <local path>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  if (argc != 3) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "objcp");
    return 1;
  }
  objcp::Run(argv[1], argv[2]);
  return 0;
}
