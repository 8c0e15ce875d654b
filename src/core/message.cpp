#include "catalog/core/message.hpp"

#include <chrono>
#include <stdexcept>

namespace catalog {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

std::optional<Role> role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  return std::nullopt;
}

int64_t now_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

Message::Message(Role role, std::string text, int64_t created) : role_(role), text_(std::move(text)), created_(created) {}

Message Message::system(const std::string &text) {
  return Message(Role::System, text, now_epoch_seconds());
}

Message Message::user(const std::string &text) {
  return Message(Role::User, text, now_epoch_seconds());
}

Message Message::user(const std::string &text, int64_t created) {
  return Message(Role::User, text, created);
}

Message Message::assistant(const std::string &text) {
  return Message(Role::Assistant, text, now_epoch_seconds());
}

Message Message::assistant(const std::string &text, int64_t created) {
  return Message(Role::Assistant, text, created);
}

json Message::to_json() const {
  json j;
  j["role"] = to_string(role_);
  j["content"] = text_;
  j["created"] = created_;
  return j;
}

Message Message::from_json(const json &j) {
  auto role_str = j.at("role").get<std::string>();
  auto role = role_from_string(role_str);
  if (!role) {
    throw std::invalid_argument("unknown message role: " + role_str);
  }

  Message msg;
  msg.role_ = *role;
  msg.text_ = j.value("content", "");
  msg.created_ = j.value("created", int64_t(0));
  return msg;
}

}  // namespace catalog
