#include <gtest/gtest.h>

#include <fstream>
#include <thread>

#include "catalog/store/message_log.hpp"
#include "test_helpers.hpp"

using namespace catalog;
using catalog::test_util::TempRootTest;
namespace fs = std::filesystem;

class MessageLogTest : public TempRootTest {
 protected:
  void SetUp() override {
    TempRootTest::SetUp();
    resolver_ = std::make_unique<PathResolver>(root_);
  }

  Location location(const std::string &id) {
    return *resolver_->resolve(id).value;
  }

  std::unique_ptr<PathResolver> resolver_;
  JsonMessageLog log_;
};

TEST_F(MessageLogTest, ReadMissingIsNotFound) {
  auto messages = log_.read(location("missing"));
  EXPECT_TRUE(messages.failed());
  EXPECT_EQ(messages.kind(), ErrorKind::NotFound);
  EXPECT_FALSE(log_.exists(location("missing")));
}

TEST_F(MessageLogTest, AppendCreatesSessionAndPreservesOrder) {
  auto loc = location("session-1");

  auto first = log_.append(loc, {Message::user("First", 100), Message::assistant("Second", 160)});
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(*first.value, 2u);
  EXPECT_TRUE(fs::is_directory(loc.dir));
  EXPECT_TRUE(log_.exists(loc));

  auto second = log_.append(loc, {Message::user("Third", 200)});
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*second.value, 3u);

  auto messages = log_.read(loc);
  ASSERT_TRUE(messages.ok());
  ASSERT_EQ(messages.value->size(), 3u);
  EXPECT_EQ((*messages.value)[0].text(), "First");
  EXPECT_EQ((*messages.value)[1].role(), Role::Assistant);
  EXPECT_EQ((*messages.value)[2].created(), 200);
}

TEST_F(MessageLogTest, SessionsAreIndependent) {
  ASSERT_TRUE(log_.append(location("a"), {Message::user("for a", 1)}).ok());
  ASSERT_TRUE(log_.append(location("b"), {Message::user("for b", 2)}).ok());

  auto a = log_.read(location("a"));
  ASSERT_TRUE(a.ok());
  ASSERT_EQ(a.value->size(), 1u);
  EXPECT_EQ(a.value->front().text(), "for a");
}

TEST_F(MessageLogTest, CorruptLogIsReportedAndNotOverwritten) {
  auto loc = location("broken");
  fs::create_directories(loc.dir);
  {
    std::ofstream out(loc.messages_file);
    out << "[{\"role\": \"user\", \"content\": ";
  }

  auto messages = log_.read(loc);
  EXPECT_EQ(messages.kind(), ErrorKind::CorruptData);

  auto appended = log_.append(loc, {Message::user("new", 1)});
  EXPECT_TRUE(appended.failed());
  EXPECT_EQ(appended.kind(), ErrorKind::CorruptData);

  // The damaged file stays as it was
  std::ifstream in(loc.messages_file);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "[{\"role\": \"user\", \"content\": ");
}

TEST_F(MessageLogTest, NonArrayLogIsCorrupt) {
  auto loc = location("object");
  fs::create_directories(loc.dir);
  std::ofstream(loc.messages_file) << "{\"role\": \"user\"}";
  EXPECT_EQ(log_.read(loc).kind(), ErrorKind::CorruptData);
}

TEST_F(MessageLogTest, NoTempFilesLeftBehind) {
  auto loc = location("clean");
  ASSERT_TRUE(log_.append(loc, {Message::user("x", 1)}).ok());
  ASSERT_TRUE(log_.append(loc, {Message::user("y", 2)}).ok());

  size_t files = 0;
  for (const auto &entry : fs::directory_iterator(loc.dir)) {
    EXPECT_EQ(entry.path().filename().string(), "messages.json");
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(MessageLogTest, ConcurrentAppendsAllLand) {
  auto loc = location("busy");
  constexpr int kThreads = 8;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto result = log_.append(loc, {Message::user("t" + std::to_string(t) + "-" + std::to_string(i), i)});
        EXPECT_TRUE(result.ok());
      }
    });
  }
  for (auto &th : threads) th.join();

  auto messages = log_.read(loc);
  ASSERT_TRUE(messages.ok());
  EXPECT_EQ(messages.value->size(), static_cast<size_t>(kThreads * kPerThread));
}
