#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "catalog/core/types.hpp"

namespace catalog {

// Per-session metadata record
//
// A default-constructed value is what a session with no persisted
// metadata reads as: empty description, zero messages, every token
// count absent, empty working directory, title not customized.
struct SessionMetadata {
  std::string description;
  int64_t message_count = 0;

  // Counts for the latest exchange
  std::optional<int64_t> total_tokens;
  std::optional<int64_t> input_tokens;
  std::optional<int64_t> output_tokens;

  // Counts across the session's full lifetime
  std::optional<int64_t> accumulated_total_tokens;
  std::optional<int64_t> accumulated_input_tokens;
  std::optional<int64_t> accumulated_output_tokens;

  std::string working_dir;
  std::optional<std::string> schedule_id;
  std::optional<std::string> project_id;
  bool is_title_customized = false;

  bool operator==(const SessionMetadata& other) const = default;

  json to_json() const;

  // Missing keys take their defaults; present keys of the wrong type throw.
  static SessionMetadata from_json(const json& j);
};

}  // namespace catalog
