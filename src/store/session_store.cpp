#include "catalog/store/session_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "catalog/analytics/title.hpp"

namespace catalog {

namespace {

Config config_with_root(const std::filesystem::path &root) {
  Config config;
  config.root = root;
  return config;
}

}  // namespace

json SessionRecord::to_json() const {
  json msgs = json::array();
  for (const auto &msg : messages) {
    msgs.push_back(msg.to_json());
  }

  json j;
  j["sessionId"] = id;
  j["metadata"] = metadata.to_json();
  j["messages"] = msgs;
  return j;
}

SessionStore::SessionStore(const Config &config) : SessionStore(config, std::make_unique<JsonMessageLog>()) {}

SessionStore::SessionStore(const std::filesystem::path &root) : SessionStore(config_with_root(root)) {}

SessionStore::SessionStore(const Config &config, std::unique_ptr<MessageLog> log)
    : config_(config), resolver_(config.root), log_(std::move(log)), catalog_(resolver_, metadata_) {}

Result<SessionMetadata> SessionStore::append_messages(const SessionId &id, const std::vector<Message> &messages) {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    return Result<SessionMetadata>::failure(*loc.error);
  }

  auto length = log_->append(*loc.value, messages);
  if (!length.ok()) {
    return Result<SessionMetadata>::failure(*length.error);
  }

  // Separate commit: a failure here leaves message_count stale, which readers tolerate.
  // Concurrent appenders may commit out of order, so the count never moves backwards.
  const auto count = static_cast<int64_t>(*length.value);
  const bool auto_title = config_.auto_title;
  const size_t max_chars = config_.title_max_chars;
  return metadata_.update(*loc.value, [&](SessionMetadata &meta) {
    meta.message_count = std::max(meta.message_count, count);
    if (auto_title && !meta.is_title_customized && meta.description.empty()) {
      meta.description = suggest_title(messages, max_chars);
    }
  });
}

Result<SessionRecord> SessionStore::get_session(const SessionId &id) const {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    return Result<SessionRecord>::failure(*loc.error);
  }

  auto metadata = metadata_.read(*loc.value);
  if (!metadata.ok()) {
    return Result<SessionRecord>::failure(*metadata.error);
  }

  auto messages = log_->read(*loc.value);
  if (!messages.ok()) {
    if (messages.kind() != ErrorKind::NotFound) {
      spdlog::error("Failed to read session messages for {}: {}", id, messages.error->message);
    }
    return Result<SessionRecord>::failure(*messages.error);
  }

  return Result<SessionRecord>::success(SessionRecord{id, std::move(*metadata.value), std::move(*messages.value)});
}

Result<SessionMetadata> SessionStore::get_metadata(const SessionId &id) const {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    return Result<SessionMetadata>::failure(*loc.error);
  }
  return metadata_.read(*loc.value);
}

Result<SessionMetadata> SessionStore::update_description(const SessionId &id, const std::string &description) {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    return Result<SessionMetadata>::failure(*loc.error);
  }

  auto result = metadata_.update(*loc.value, [&description](SessionMetadata &meta) {
    meta.description = description;
    meta.is_title_customized = true;
  });
  if (result.ok()) {
    spdlog::info("Updated description of session {}", id);
  }
  return result;
}

Result<SessionMetadata> SessionStore::update_metadata(const SessionId &id, const SessionMetadata &metadata) {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    return Result<SessionMetadata>::failure(*loc.error);
  }
  return metadata_.update(*loc.value, [&metadata](SessionMetadata &meta) { meta = metadata; });
}

Result<std::vector<SessionInfo>> SessionStore::list_sessions(SortOrder order) const {
  return catalog_.list(order);
}

Result<SessionInsights> SessionStore::insights() const {
  auto sessions = catalog_.list(SortOrder::Descending);
  if (!sessions.ok()) {
    spdlog::error("Failed to get session info: {}", sessions.error->message);
    return Result<SessionInsights>::failure(*sessions.error);
  }

  InsightsAggregator aggregator(resolver_, *log_, {config_.insights.top_dirs, config_.insights.recent_days});
  return Result<SessionInsights>::success(aggregator.compute(*sessions.value));
}

Result<std::vector<ActivityHeatmapCell>> SessionStore::activity_heatmap() const {
  auto sessions = catalog_.list(SortOrder::Descending);
  if (!sessions.ok()) {
    return Result<std::vector<ActivityHeatmapCell>>::failure(*sessions.error);
  }
  return Result<std::vector<ActivityHeatmapCell>>::success(HeatmapAggregator{}.compute(*sessions.value));
}

}  // namespace catalog
