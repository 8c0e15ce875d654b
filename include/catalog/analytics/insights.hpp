#pragma once

#include <string>
#include <vector>

#include "catalog/core/types.hpp"
#include "catalog/store/message_log.hpp"
#include "catalog/store/path_resolver.hpp"
#include "catalog/store/session_catalog.hpp"

namespace catalog {

struct DirectoryUsage {
  std::string dir;
  size_t count = 0;

  bool operator==(const DirectoryUsage &other) const = default;
};

struct DailyActivity {
  std::string date;  // kDateFormat
  size_t count = 0;

  bool operator==(const DailyActivity &other) const = default;
};

// Aggregate usage statistics over the described sessions of a catalog
struct SessionInsights {
  size_t total_sessions = 0;
  std::vector<DirectoryUsage> most_active_dirs;  // Count descending, then path ascending
  double avg_session_duration_minutes = 0.0;
  int64_t total_tokens = 0;
  std::vector<DailyActivity> recent_activity;  // Date descending

  json to_json() const;
};

class InsightsAggregator {
 public:
  struct Options {
    size_t top_dirs = 3;
    size_t recent_days = 7;
  };

  // The message log is consulted for session durations
  InsightsAggregator(const PathResolver &resolver, const MessageLog &log);
  InsightsAggregator(const PathResolver &resolver, const MessageLog &log, Options options);

  // Sessions without a description are ignored. Never fails: records that
  // cannot be used for one statistic are logged and left out of it.
  SessionInsights compute(const std::vector<SessionInfo> &sessions) const;

 private:
  double session_duration_minutes(const SessionId &id) const;

  const PathResolver &resolver_;
  const MessageLog &log_;
  Options options_;
};

}  // namespace catalog
