#include "catalog/analytics/title.hpp"

#include <sstream>

namespace catalog {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Number of code points in a UTF-8 string
size_t char_count(const std::string &s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if (!is_continuation(c)) ++n;
  }
  return n;
}

// Longest prefix holding at most max_chars code points, never splitting a sequence
std::string char_prefix(const std::string &s, size_t max_chars) {
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[i]))) {
      if (n == max_chars) return s.substr(0, i);
      ++n;
    }
  }
  return s;
}

}  // namespace

std::string suggest_title(const std::string &text, size_t max_chars) {
  auto clean = trim(text);
  if (char_count(clean) <= max_chars) {
    return clean;
  }

  std::string title;
  size_t title_chars = 0;
  std::istringstream words(clean);
  std::string word;
  while (words >> word) {
    size_t word_chars = char_count(word);
    size_t needed = title.empty() ? word_chars : title_chars + 1 + word_chars;
    if (needed > max_chars) break;
    if (!title.empty()) title += ' ';
    title += word;
    title_chars = needed;
  }

  if (title.empty()) {
    return char_prefix(clean, max_chars > 3 ? max_chars - 3 : 0) + "...";
  }
  return title + "...";
}

std::string suggest_title(const std::vector<Message> &messages, size_t max_chars) {
  for (const auto &msg : messages) {
    if (msg.role() == Role::User && !trim(msg.text()).empty()) {
      return suggest_title(msg.text(), max_chars);
    }
  }
  return "";
}

}  // namespace catalog
