#pragma once

#include <filesystem>
#include <string>

#include "catalog/core/types.hpp"

namespace catalog {

// Where one session's files live
struct Location {
  SessionId id;
  std::filesystem::path dir;
  std::filesystem::path messages_file;
  std::filesystem::path metadata_file;

  bool operator==(const Location& other) const = default;
};

// Maps session ids to locations under a catalog root.
//
// Storage layout:
//   root/
//     {session_id}/
//       messages.json   — message log
//       metadata.json   — session metadata
class PathResolver {
 public:
  explicit PathResolver(std::filesystem::path root);

  // Pure: the same id always yields the same location, distinct ids distinct ones
  Result<Location> resolve(const SessionId& id) const;

  // Non-empty, at most 255 bytes, no separators, NUL, "..", or leading '.'
  static bool is_valid(const SessionId& id);

  const std::filesystem::path& root() const { return root_; }

  static constexpr const char* kMessagesFileName = "messages.json";
  static constexpr const char* kMetadataFileName = "metadata.json";

 private:
  std::filesystem::path root_;
};

}  // namespace catalog
