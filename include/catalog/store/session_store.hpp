#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "catalog/analytics/heatmap.hpp"
#include "catalog/analytics/insights.hpp"
#include "catalog/core/config.hpp"
#include "catalog/core/message.hpp"
#include "catalog/core/metadata.hpp"
#include "catalog/core/types.hpp"
#include "catalog/store/message_log.hpp"
#include "catalog/store/metadata_store.hpp"
#include "catalog/store/path_resolver.hpp"
#include "catalog/store/session_catalog.hpp"

namespace catalog {

// One session as returned to callers
struct SessionRecord {
  SessionId id;
  SessionMetadata metadata;
  std::vector<Message> messages;

  json to_json() const;
};

// Session catalog over one root directory: per-session reads and updates,
// listing, and the cross-session analytics.
//
// Every call re-reads durable state; nothing is cached between calls.
class SessionStore {
 public:
  explicit SessionStore(const Config &config);

  // Uses JsonMessageLog
  explicit SessionStore(const std::filesystem::path &root);

  SessionStore(const Config &config, std::unique_ptr<MessageLog> log);

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  // Appends messages, creating the session on first persist, then records the
  // new log length as message_count. Returns the committed metadata.
  Result<SessionMetadata> append_messages(const SessionId &id, const std::vector<Message> &messages);

  // Metadata (default when none is stored) plus the message log (NotFound if absent)
  Result<SessionRecord> get_session(const SessionId &id) const;

  Result<SessionMetadata> get_metadata(const SessionId &id) const;

  // Sets the description (empty allowed) and marks the title as customized.
  // NotFound for sessions that were never persisted.
  Result<SessionMetadata> update_description(const SessionId &id, const std::string &description);

  // Replaces the whole metadata record of an existing session
  Result<SessionMetadata> update_metadata(const SessionId &id, const SessionMetadata &metadata);

  Result<std::vector<SessionInfo>> list_sessions(SortOrder order = SortOrder::Descending) const;

  // Fails only when the catalog root cannot be enumerated
  Result<SessionInsights> insights() const;
  Result<std::vector<ActivityHeatmapCell>> activity_heatmap() const;

  const PathResolver &resolver() const { return resolver_; }
  const Config &config() const { return config_; }

 private:
  Config config_;
  PathResolver resolver_;
  std::unique_ptr<MessageLog> log_;
  MetadataStore metadata_;
  SessionCatalog catalog_;
};

}  // namespace catalog
