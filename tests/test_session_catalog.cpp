#include <gtest/gtest.h>

#include <fstream>

#include "catalog/store/message_log.hpp"
#include "catalog/store/session_catalog.hpp"
#include "test_helpers.hpp"

using namespace catalog;
using catalog::test_util::set_modified;
using catalog::test_util::TempRootTest;
using catalog::test_util::utc;
namespace fs = std::filesystem;

class SessionCatalogTest : public TempRootTest {
 protected:
  void SetUp() override {
    TempRootTest::SetUp();
    resolver_ = std::make_unique<PathResolver>(root_);
    catalog_ = std::make_unique<SessionCatalog>(*resolver_, metadata_);
  }

  Location create_session(const std::string &id, const std::string &description, const std::string &modified) {
    auto loc = *resolver_->resolve(id).value;
    EXPECT_TRUE(log_.append(loc, {Message::user("hello", 1)}).ok());
    SessionMetadata meta;
    meta.description = description;
    meta.message_count = 1;
    EXPECT_TRUE(metadata_.write(loc, meta).ok());
    set_modified(loc, utc(modified));
    return loc;
  }

  static std::vector<std::string> ids(const std::vector<SessionInfo> &sessions) {
    std::vector<std::string> out;
    for (const auto &s : sessions) out.push_back(s.id);
    return out;
  }

  std::unique_ptr<PathResolver> resolver_;
  JsonMessageLog log_;
  MetadataStore metadata_;
  std::unique_ptr<SessionCatalog> catalog_;
};

TEST_F(SessionCatalogTest, EmptyCatalog) {
  auto sessions = catalog_->list();
  ASSERT_TRUE(sessions.ok());
  EXPECT_TRUE(sessions.value->empty());
}

TEST_F(SessionCatalogTest, MissingRootIsEmpty) {
  PathResolver resolver(root_ / "does-not-exist");
  SessionCatalog catalog(resolver, metadata_);
  auto sessions = catalog.list();
  ASSERT_TRUE(sessions.ok());
  EXPECT_TRUE(sessions.value->empty());
}

TEST_F(SessionCatalogTest, RootThatIsAFileFails) {
  auto file_root = root_ / "plain-file";
  std::ofstream(file_root) << "not a directory";

  PathResolver resolver(file_root);
  SessionCatalog catalog(resolver, metadata_);
  auto sessions = catalog.list();
  EXPECT_TRUE(sessions.failed());
  EXPECT_EQ(sessions.kind(), ErrorKind::IOFailure);
}

TEST_F(SessionCatalogTest, ListsWithMetadataAndFormattedTime) {
  create_session("s1", "First session", "2024-03-10 14:05:09 UTC");

  auto sessions = catalog_->list();
  ASSERT_TRUE(sessions.ok());
  ASSERT_EQ(sessions.value->size(), 1u);
  const auto &info = sessions.value->front();
  EXPECT_EQ(info.id, "s1");
  EXPECT_EQ(info.modified, "2024-03-10 14:05:09 UTC");
  EXPECT_EQ(info.metadata.description, "First session");
  EXPECT_EQ(info.metadata.message_count, 1);
}

TEST_F(SessionCatalogTest, SortsByRecencyThenId) {
  create_session("old", "a", "2024-01-01 10:00:00 UTC");
  create_session("new", "b", "2024-02-01 10:00:00 UTC");
  create_session("tie-b", "c", "2024-01-15 10:00:00 UTC");
  create_session("tie-a", "d", "2024-01-15 10:00:00 UTC");

  auto desc = catalog_->list(SortOrder::Descending);
  ASSERT_TRUE(desc.ok());
  EXPECT_EQ(ids(*desc.value), (std::vector<std::string>{"new", "tie-a", "tie-b", "old"}));

  auto asc = catalog_->list(SortOrder::Ascending);
  ASSERT_TRUE(asc.ok());
  EXPECT_EQ(ids(*asc.value), (std::vector<std::string>{"old", "tie-a", "tie-b", "new"}));
}

TEST_F(SessionCatalogTest, SkipsCorruptRecords) {
  create_session("good", "fine", "2024-01-01 10:00:00 UTC");
  auto bad = create_session("bad", "broken", "2024-01-02 10:00:00 UTC");
  std::ofstream(bad.metadata_file) << "{\"description\": ";

  auto sessions = catalog_->list();
  ASSERT_TRUE(sessions.ok());
  EXPECT_EQ(ids(*sessions.value), (std::vector<std::string>{"good"}));
}

TEST_F(SessionCatalogTest, SessionWithoutMetadataListsWithDefaults) {
  auto loc = *resolver_->resolve("log-only").value;
  ASSERT_TRUE(log_.append(loc, {Message::user("hi", 1)}).ok());

  auto sessions = catalog_->list();
  ASSERT_TRUE(sessions.ok());
  ASSERT_EQ(sessions.value->size(), 1u);
  EXPECT_TRUE(sessions.value->front().metadata == SessionMetadata{});
}

TEST_F(SessionCatalogTest, IgnoresStrayEntries) {
  create_session("real", "x", "2024-01-01 10:00:00 UTC");
  fs::create_directories(root_ / ".hidden");
  fs::create_directories(root_ / "empty-dir");
  std::ofstream(root_ / "notes.txt") << "stray";

  auto sessions = catalog_->list();
  ASSERT_TRUE(sessions.ok());
  EXPECT_EQ(ids(*sessions.value), (std::vector<std::string>{"real"}));
}

TEST_F(SessionCatalogTest, SortOrderStrings) {
  EXPECT_EQ(sort_order_from_string("asc"), SortOrder::Ascending);
  EXPECT_EQ(sort_order_from_string("descending"), SortOrder::Descending);
  EXPECT_EQ(sort_order_from_string("whatever"), SortOrder::Descending);
  EXPECT_EQ(to_string(SortOrder::Ascending), "ascending");
}
