#include "gtest/gtest.h"
#include "glog/logging.h"

#include "core/copy_engine.hpp"
#include "io/fake_object_client.hpp"
#include "io/fake_reader.hpp"
#include "io/fake_storage.hpp"
#include "io/local_storage.hpp"
#include "io/object_storage.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "boost/filesystem.hpp"

namespace objcp {
namespace {

namespace fs = boost::filesystem;

class TestCopyEngine : public testing::Test {};

// A closed stream holding the given relative paths under "/data".
std::shared_ptr<ItemStream> MakeStream(const std::vector<std::string>& names,
                                       std::atomic<int>* num_released = nullptr) {
  auto stream = std::make_shared<ItemStream>(names.size() + 1);
  for (auto& name : names) {
    stream->Push(Item("/data", "/data/" + name, name.size(),
                      std::unique_ptr<AbstractReader>(new FakeReader(name, num_released))));
  }
  stream->Close();
  return stream;
}

CopyOptions Options(int concurrency, bool continue_on_error) {
  CopyOptions options;
  options.concurrency = concurrency;
  options.continue_on_error = continue_on_error;
  return options;
}

TEST_F(TestCopyEngine, CommitsEveryItem) {
  auto dst = std::make_shared<FakeStorage>();
  std::atomic<int> num_released{0};
  CopyEngine engine(dst, Options(3, false));
  EXPECT_TRUE(engine.Run(MakeStream({"a", "b", "c", "d/e"}, &num_released)));
  EXPECT_EQ(engine.GetNumCommitted(), 4);
  EXPECT_EQ(engine.GetNumFailed(), 0);
  EXPECT_EQ(dst->committed.size(), 4);
  EXPECT_EQ(dst->committed.at("d/e"), "d/e");
  EXPECT_EQ(num_released.load(), 4);
}

TEST_F(TestCopyEngine, EmptyStream) {
  auto dst = std::make_shared<FakeStorage>();
  CopyEngine engine(dst, Options(2, false));
  EXPECT_TRUE(engine.Run(MakeStream({})));
  EXPECT_TRUE(dst->attempted.empty());
}

TEST_F(TestCopyEngine, ContinueOnErrorAttemptsAll) {
  auto dst = std::make_shared<FakeStorage>();
  dst->failing = {"b", "d"};
  std::atomic<int> num_released{0};
  CopyEngine engine(dst, Options(2, true));
  EXPECT_TRUE(engine.Run(MakeStream({"a", "b", "c", "d", "e"}, &num_released)));
  std::sort(dst->attempted.begin(), dst->attempted.end());
  EXPECT_EQ(dst->attempted, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
  EXPECT_EQ(engine.GetNumCommitted(), 3);
  EXPECT_EQ(engine.GetNumFailed(), 2);
  EXPECT_EQ(num_released.load(), 5);
}

TEST_F(TestCopyEngine, FailFastStopsDispatch) {
  auto dst = std::make_shared<FakeStorage>();
  dst->failing = {"b"};
  std::atomic<int> num_released{0};
  CopyEngine engine(dst, Options(1, false));
  EXPECT_FALSE(engine.Run(MakeStream({"a", "b", "c", "d"}, &num_released)));
  EXPECT_EQ(dst->attempted, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(engine.GetNumCommitted(), 1);
  EXPECT_EQ(engine.GetNumFailed(), 1);
  // c and d were dropped with the queue
  EXPECT_EQ(num_released.load(), 4);
}

TEST_F(TestCopyEngine, ReadFailureCountsAsFailure) {
  auto dst = std::make_shared<FakeStorage>();
  auto stream = std::make_shared<ItemStream>();
  stream->Push(Item("/data", "/data/x", 1, std::unique_ptr<AbstractReader>(new FailingReader)));
  stream->Close();
  CopyEngine engine(dst, Options(1, true));
  EXPECT_TRUE(engine.Run(stream));
  EXPECT_EQ(engine.GetNumFailed(), 1);
  EXPECT_TRUE(dst->committed.empty());
}

TEST_F(TestCopyEngine, AtMostNInFlight) {
  auto dst = std::make_shared<FakeStorage>();
  dst->delay_ms = 20;
  std::vector<std::string> names;
  for (int i = 0; i < 12; ++i) {
    names.push_back("f" + std::to_string(i));
  }
  CopyEngine engine(dst, Options(3, false));
  EXPECT_TRUE(engine.Run(MakeStream(names)));
  EXPECT_EQ(dst->committed.size(), 12);
  EXPECT_LE(dst->max_in_flight, 3);
  EXPECT_GE(dst->max_in_flight, 1);
}

TEST_F(TestCopyEngine, ProducerFeedsWorkers) {
  auto dst = std::make_shared<FakeStorage>();
  dst->prefix = "out";
  auto stream = ItemStream::Spawn([](ItemStream* s) {
    for (int i = 0; i < 100; ++i) {
      std::string name = "n" + std::to_string(i);
      s->Push(Item("/src/", "/src/" + name, name.size(),
                   std::unique_ptr<AbstractReader>(new FakeReader(name))));
    }
  }, 4);
  CopyEngine engine(dst, Options(5, false));
  EXPECT_TRUE(engine.Run(stream));
  EXPECT_EQ(dst->committed.size(), 100);
  EXPECT_EQ(dst->committed.at("out/n42"), "n42");
}

class TestCopyScenario : public testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / fs::unique_path("objcp-copy-%%%%-%%%%-%%%%");
    fs::create_directories(root_ / "data" / "sub");
    WriteFile(root_ / "data" / "a.txt", std::string(10, 'a'));
    WriteFile(root_ / "data" / "sub" / "b.txt", std::string(20, 'b'));
  }
  void TearDown() override {
    boost::system::error_code ec;
    fs::remove_all(root_, ec);
  }

  void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path.string(), std::ios::binary);
    out << content;
  }

  fs::path root_;
};

TEST_F(TestCopyScenario, LocalToBucket) {
  LocalStorage src((root_ / "data").string());
  auto client = std::make_shared<FakeObjectClient>();
  auto dst = std::make_shared<ObjectStorage>(client, "backup/");
  CopyEngine engine(dst, Options(2, false));
  EXPECT_TRUE(engine.Run(src.ListFiles()));
  ASSERT_EQ(client->objects.size(), 2);
  EXPECT_EQ(client->objects.at("backup/a.txt"), std::string(10, 'a'));
  EXPECT_EQ(client->objects.at("backup/sub/b.txt"), std::string(20, 'b'));
  EXPECT_EQ(client->declared_sizes.at("backup/sub/b.txt"), 20);
}

TEST_F(TestCopyScenario, BucketToLocal) {
  auto client = std::make_shared<FakeObjectClient>();
  client->objects["backup/a.txt"] = "hello";
  client->objects["backup/sub/b.txt"] = "world";
  client->objects["elsewhere/c.txt"] = "skip";
  ObjectStorage src(client, "backup/");
  auto dst = std::make_shared<LocalStorage>((root_ / "restore").string());
  Copy(dst, src.ListFiles(), 2, false);
  EXPECT_TRUE(fs::exists(root_ / "restore" / "a.txt"));
  EXPECT_TRUE(fs::exists(root_ / "restore" / "sub" / "b.txt"));
  EXPECT_FALSE(fs::exists(root_ / "restore" / "c.txt"));
}

TEST_F(TestCopyScenario, BucketWithFolderMarkersToLocal) {
  auto client = std::make_shared<FakeObjectClient>();
  client->objects["backup/"] = "";
  client->objects["backup/sub/"] = "";
  client->objects["backup/a.txt"] = "x";
  client->objects["backup/sub/b.txt"] = "y";
  ObjectStorage src(client, "backup/");
  auto dst = std::make_shared<LocalStorage>((root_ / "fresh").string());
  CopyEngine engine(dst, Options(1, false));
  EXPECT_TRUE(engine.Run(src.ListFiles()));
  EXPECT_EQ(engine.GetNumCommitted(), 2);
  EXPECT_EQ(engine.GetNumFailed(), 0);
  EXPECT_TRUE(fs::is_directory(root_ / "fresh"));
  EXPECT_TRUE(fs::is_regular_file(root_ / "fresh" / "a.txt"));
  EXPECT_TRUE(fs::is_regular_file(root_ / "fresh" / "sub" / "b.txt"));
}

TEST_F(TestCopyScenario, KeysLeavingRootAreNotWritten) {
  auto client = std::make_shared<FakeObjectClient>();
  client->objects["backup/../escaped.txt"] = "x";
  client->objects["backup/a.txt"] = "y";
  ObjectStorage src(client, "backup/");
  auto dst = std::make_shared<LocalStorage>((root_ / "restore").string());
  CopyEngine engine(dst, Options(1, true));
  EXPECT_TRUE(engine.Run(src.ListFiles()));
  EXPECT_EQ(engine.GetNumFailed(), 1);
  EXPECT_EQ(engine.GetNumCommitted(), 1);
  EXPECT_FALSE(fs::exists(root_ / "escaped.txt"));
  EXPECT_TRUE(fs::exists(root_ / "restore" / "a.txt"));
}

TEST_F(TestCopyScenario, FailFastAbortsRun) {
  LocalStorage src((root_ / "data").string());
  auto dst = std::make_shared<FakeStorage>();
  dst->prefix = "backup/";
  dst->failing = {"backup/sub/b.txt"};
  CopyEngine engine(dst, Options(2, false));
  EXPECT_FALSE(engine.Run(src.ListFiles()));
  EXPECT_EQ(engine.GetNumFailed(), 1);
  EXPECT_EQ(dst->committed.count("backup/sub/b.txt"), 0);
}

TEST_F(TestCopyScenario, CopyDiesOnAbort) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  LocalStorage src((root_ / "data").string());
  auto dst = std::make_shared<FakeStorage>();
  dst->failing = {"a.txt"};
  EXPECT_DEATH(Copy(dst, src.ListFiles(), 1, false), "Aborting run");
}

}  // namespace
}  // namespace objcp
