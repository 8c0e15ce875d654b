#pragma once

#include <string>
#include <vector>

#include "catalog/core/metadata.hpp"
#include "catalog/core/types.hpp"
#include "catalog/store/metadata_store.hpp"
#include "catalog/store/path_resolver.hpp"

namespace catalog {

enum class SortOrder { Ascending, Descending };

std::string to_string(SortOrder order);

SortOrder sort_order_from_string(const std::string &str);

// Catalog listing entry
struct SessionInfo {
  SessionId id;
  std::string modified;  // kModifiedTimeFormat
  SessionMetadata metadata;

  json to_json() const;
};

// Enumerates every session under the catalog root
class SessionCatalog {
 public:
  SessionCatalog(const PathResolver &resolver, const MetadataStore &metadata);

  // Sorted by modification time per order, ties by id ascending.
  // Sessions whose metadata is corrupt or unreadable are skipped with a warning.
  // A missing root is an empty catalog; IOFailure only if the root cannot be enumerated.
  Result<std::vector<SessionInfo>> list(SortOrder order = SortOrder::Descending) const;

 private:
  const PathResolver &resolver_;
  const MetadataStore &metadata_;
};

}  // namespace catalog
