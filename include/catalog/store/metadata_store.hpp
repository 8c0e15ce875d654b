#pragma once

#include <functional>
#include <optional>

#include "catalog/core/lock_table.hpp"
#include "catalog/core/metadata.hpp"
#include "catalog/core/types.hpp"
#include "catalog/store/path_resolver.hpp"

namespace catalog {

// Per-session metadata kept in {session}/metadata.json
class MetadataStore {
 public:
  using Mutator = std::function<void(SessionMetadata &)>;

  MetadataStore() = default;

  // Explicit presence: nullopt when no metadata file exists.
  // CorruptData if the file exists but cannot be parsed.
  Result<std::optional<SessionMetadata>> load(const Location &location) const;

  // Like load(), but a missing file reads as a default SessionMetadata
  Result<SessionMetadata> read(const Location &location) const;

  // Replaces the record. NotFound if the session directory does not exist.
  Status write(const Location &location, const SessionMetadata &metadata);

  // Read-modify-write committed through one atomic rename. Concurrent
  // updates of the same session serialize; readers see the old or the new
  // record, never a mix.
  //
  // NotFound if the session directory does not exist (nothing is created).
  // A session without a metadata file starts from the default record.
  // Returns the committed record.
  Result<SessionMetadata> update(const Location &location, const Mutator &mutate);

 private:
  Status commit(const Location &location, const SessionMetadata &metadata);

  LockTable locks_;
};

}  // namespace catalog
