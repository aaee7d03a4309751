#include "gtest/gtest.h"
#include "glog/logging.h"

#include "io/s3/s3_client.hpp"
#include "io/s3/s3_regions.hpp"

namespace objcp {
namespace {

class TestS3Client : public testing::Test {};

const char kListing[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
    "<Name>bucket</Name><Prefix>backup/</Prefix><Marker></Marker>"
    "<MaxKeys>1000</MaxKeys><IsTruncated>true</IsTruncated>"
    "<Contents><Key>backup/a.txt</Key><Size>10</Size></Contents>"
    "<Contents><Key>backup/sub/b.txt</Key><Size>20</Size></Contents>"
    "</ListBucketResult>";

TEST_F(TestS3Client, ParseListBucketResult) {
  ObjectListing listing;
  ASSERT_TRUE(ParseListBucketResult(kListing, &listing).ok());
  ASSERT_EQ(listing.objects.size(), 2);
  EXPECT_EQ(listing.objects[0].key, "backup/a.txt");
  EXPECT_EQ(listing.objects[0].size, 10);
  EXPECT_EQ(listing.objects[1].key, "backup/sub/b.txt");
  EXPECT_EQ(listing.objects[1].size, 20);
  EXPECT_TRUE(listing.truncated);
  // no NextMarker: continue after the last key
  EXPECT_EQ(listing.next_marker, "backup/sub/b.txt");
}

TEST_F(TestS3Client, ParseListBucketResultNextMarker) {
  ObjectListing listing;
  ASSERT_TRUE(ParseListBucketResult(
                  "<ListBucketResult><IsTruncated>true</IsTruncated><NextMarker>m</NextMarker>"
                  "<Contents><Key>a</Key><Size>1</Size></Contents></ListBucketResult>",
                  &listing)
                  .ok());
  EXPECT_EQ(listing.next_marker, "m");
}

TEST_F(TestS3Client, ParseListBucketResultEmpty) {
  ObjectListing listing;
  ASSERT_TRUE(ParseListBucketResult(
                  "<ListBucketResult><IsTruncated>false</IsTruncated></ListBucketResult>",
                  &listing)
                  .ok());
  EXPECT_TRUE(listing.objects.empty());
  EXPECT_FALSE(listing.truncated);
  EXPECT_EQ(listing.next_marker, "");
}

TEST_F(TestS3Client, ParseListBucketResultMalformed) {
  ObjectListing listing;
  EXPECT_FALSE(ParseListBucketResult("<Error><Code>AccessDenied</Code></Error>", &listing).ok());
  EXPECT_FALSE(ParseListBucketResult("not xml <", &listing).ok());
}

TEST_F(TestS3Client, ParseBucketUrl) {
  S3Config config;
  ASSERT_TRUE(ParseS3BucketUrl("https://s3-us-west-1.amazonaws.com/my-bucket", &config).ok());
  EXPECT_EQ(config.endpoint, "https://s3-us-west-1.amazonaws.com");
  EXPECT_EQ(config.bucket, "my-bucket");
  EXPECT_EQ(config.region, "us-west-1");
}

TEST_F(TestS3Client, ParseBucketUrlUnknownEndpoint) {
  S3Config config;
  EXPECT_FALSE(ParseS3BucketUrl("http://localhost:9000/bucket", &config).ok());

  config.region = "us-east-1";
  ASSERT_TRUE(ParseS3BucketUrl("http://localhost:9000/bucket/", &config).ok());
  EXPECT_EQ(config.endpoint, "http://localhost:9000");
  EXPECT_EQ(config.bucket, "bucket");
  EXPECT_EQ(config.region, "us-east-1");
}

TEST_F(TestS3Client, ParseBucketUrlWithoutBucket) {
  S3Config config;
  EXPECT_FALSE(ParseS3BucketUrl("https://s3.amazonaws.com/", &config).ok());
}

TEST_F(TestS3Client, CreateValidatesConfig) {
  S3Config config;
  config.endpoint = "https://s3.amazonaws.com";
  config.region = "us-east-1";
  config.bucket = "bucket";
  std::shared_ptr<S3Client> client;
  EXPECT_FALSE(S3Client::Create(config, &client).ok());

  config.credentials.access_key = "key";
  config.credentials.secret_key = "secret";
  ASSERT_TRUE(S3Client::Create(config, &client).ok());
  EXPECT_EQ(client->Name(), "s3://bucket");
}

TEST_F(TestS3Client, LookupRegion) {
  S3Region region;
  ASSERT_TRUE(LookupRegionByEndpoint("https://s3.amazonaws.com", &region).ok());
  EXPECT_EQ(region.name, "us-east-1");
  ASSERT_TRUE(LookupRegionByEndpoint("https://s3.cn-north-1.amazonaws.com.cn", &region).ok());
  EXPECT_EQ(region.name, "cn-north-1");
  EXPECT_FALSE(LookupRegionByEndpoint("https://example.com", &region).ok());
}

}  // namespace
}  // namespace objcp
