#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "catalog/core/types.hpp"

namespace catalog {

// Message role
enum class Role {
  System,
  User,
  Assistant
};

std::string to_string(Role role);

// Returns nullopt for roles this store does not know about
std::optional<Role> role_from_string(const std::string& str);

// One entry of a session's message log
class Message {
 public:
  Message() = default;
  Message(Role role, std::string text, int64_t created);

  // Factory methods, stamped with the current time unless given one
  static Message system(const std::string& text);
  static Message user(const std::string& text);
  static Message user(const std::string& text, int64_t created);
  static Message assistant(const std::string& text);
  static Message assistant(const std::string& text, int64_t created);

  Role role() const { return role_; }
  const std::string& text() const { return text_; }

  // Epoch seconds
  int64_t created() const { return created_; }
  void set_created(int64_t created) { created_ = created; }

  bool operator==(const Message& other) const = default;

  // Serialization. from_json throws on malformed input.
  json to_json() const;
  static Message from_json(const json& j);

 private:
  Role role_ = Role::User;
  std::string text_;
  int64_t created_ = 0;
};

int64_t now_epoch_seconds();

}  // namespace catalog
