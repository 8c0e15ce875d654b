#include <gtest/gtest.h>

#include "catalog/analytics/title.hpp"

using namespace catalog;

TEST(TitleTest, ShortTextIsKept) {
  EXPECT_EQ(suggest_title("  Fix the build  "), "Fix the build");
  EXPECT_EQ(suggest_title(""), "");
  EXPECT_EQ(suggest_title("   \n"), "");
}

TEST(TitleTest, LongTextBreaksOnWords) {
  std::string text = "Please help me refactor the session storage layer so that updates are atomic";
  auto title = suggest_title(text);
  EXPECT_EQ(title, "Please help me refactor the session storage layer...");
  EXPECT_LE(title.size(), 50u + 3u);
}

TEST(TitleTest, SingleLongWordIsCut) {
  std::string word(80, 'x');
  EXPECT_EQ(suggest_title(word), std::string(47, 'x') + "...");
}

TEST(TitleTest, CustomLimit) {
  EXPECT_EQ(suggest_title("alpha beta gamma", 10), "alpha beta...");
}

TEST(TitleTest, FromFirstUserMessage) {
  std::vector<Message> messages{Message(Role::System, "You are helpful", 1), Message::assistant("Hi", 2),
                                Message::user("  ", 3), Message::user("Explain ISO weeks", 4),
                                Message::user("Second question", 5)};
  EXPECT_EQ(suggest_title(messages), "Explain ISO weeks");
  EXPECT_EQ(suggest_title(std::vector<Message>{Message::assistant("only me", 1)}), "");
}

TEST(TitleTest, CountsCharactersNotBytes) {
  std::string accented;
  for (int i = 0; i < 30; ++i) accented += "\xC3\xA9";  // é
  EXPECT_EQ(suggest_title(accented), accented);

  std::string cafe = "caf\xC3\xA9 th\xC3\xA9 cr\xC3\xA8me";
  EXPECT_EQ(suggest_title(cafe, 14), cafe);
  EXPECT_EQ(suggest_title(cafe, 10), "caf\xC3\xA9 th\xC3\xA9...");
}

TEST(TitleTest, HardCutKeepsWholeCodePoints) {
  std::string word;
  for (int i = 0; i < 60; ++i) word += "\xC3\xA9";
  std::string expected;
  for (int i = 0; i < 47; ++i) expected += "\xC3\xA9";
  expected += "...";

  auto title = suggest_title(word);
  EXPECT_EQ(title, expected);
  EXPECT_NO_THROW(json(title).dump());
}
