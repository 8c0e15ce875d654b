#include "catalog/analytics/insights.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

#include "catalog/core/time_format.hpp"

namespace catalog {

json SessionInsights::to_json() const {
  json dirs = json::array();
  for (const auto &d : most_active_dirs) {
    dirs.push_back(json::array({d.dir, d.count}));
  }
  json activity = json::array();
  for (const auto &a : recent_activity) {
    activity.push_back(json::array({a.date, a.count}));
  }

  json j;
  j["totalSessions"] = total_sessions;
  j["mostActiveDirs"] = dirs;
  j["avgSessionDuration"] = avg_session_duration_minutes;
  j["totalTokens"] = total_tokens;
  j["recentActivity"] = activity;
  return j;
}

InsightsAggregator::InsightsAggregator(const PathResolver &resolver, const MessageLog &log)
    : InsightsAggregator(resolver, log, Options{}) {}

InsightsAggregator::InsightsAggregator(const PathResolver &resolver, const MessageLog &log, Options options)
    : resolver_(resolver), log_(log), options_(options) {}

double InsightsAggregator::session_duration_minutes(const SessionId &id) const {
  auto loc = resolver_.resolve(id);
  if (!loc.ok()) {
    spdlog::warn("Cannot resolve session {} for duration: {}", id, loc.error->message);
    return 0.0;
  }

  auto messages = log_.read(*loc.value);
  if (!messages.ok()) {
    if (messages.kind() != ErrorKind::NotFound) {
      spdlog::warn("Cannot read messages of session {}: {}", id, messages.error->message);
    }
    return 0.0;
  }

  const auto &log = *messages.value;
  if (log.size() < 2) {
    return 0.0;
  }
  return static_cast<double>(log.back().created() - log.front().created()) / 60.0;
}

SessionInsights InsightsAggregator::compute(const std::vector<SessionInfo> &sessions) const {
  std::vector<const SessionInfo *> described;
  for (const auto &session : sessions) {
    if (!session.metadata.description.empty()) {
      described.push_back(&session);
    }
  }

  spdlog::info("Found {} sessions with descriptions", described.size());

  SessionInsights insights;
  insights.total_sessions = described.size();
  if (described.empty()) {
    spdlog::info("No sessions with descriptions, insights are empty");
    return insights;
  }

  std::map<std::string, size_t> dir_counts;
  std::map<std::string, size_t> activity_by_date;
  double total_duration = 0.0;

  for (const auto *session : described) {
    ++dir_counts[session->metadata.working_dir];

    // Only positive values count so a bad record cannot shrink the total
    if (auto tokens = session->metadata.accumulated_total_tokens) {
      if (*tokens > 0) {
        insights.total_tokens += *tokens;
      } else if (*tokens < 0) {
        spdlog::warn("Session {} has negative accumulated_total_tokens: {}", session->id, *tokens);
      }
    }

    if (auto modified = parse_utc(session->modified)) {
      ++activity_by_date[format_date(std::chrono::floor<std::chrono::days>(*modified))];
    } else {
      spdlog::debug("Session {} has unparsable modified time '{}'", session->id, session->modified);
    }

    total_duration += session_duration_minutes(session->id);
  }

  // Count descending; std::map iteration plus stable_sort keeps path order on ties
  std::vector<DirectoryUsage> dirs;
  for (const auto &[dir, count] : dir_counts) {
    dirs.push_back(DirectoryUsage{dir, count});
  }
  std::stable_sort(dirs.begin(), dirs.end(), [](const DirectoryUsage &a, const DirectoryUsage &b) {
    return a.count > b.count;
  });
  if (dirs.size() > options_.top_dirs) {
    dirs.resize(options_.top_dirs);
  }
  insights.most_active_dirs = std::move(dirs);

  insights.avg_session_duration_minutes = total_duration / static_cast<double>(insights.total_sessions);

  for (auto it = activity_by_date.rbegin(); it != activity_by_date.rend(); ++it) {
    if (insights.recent_activity.size() >= options_.recent_days) break;
    insights.recent_activity.push_back(DailyActivity{it->first, it->second});
  }

  spdlog::info("Computed insights: {} sessions, {} tokens, {:.2f} min average", insights.total_sessions,
               insights.total_tokens, insights.avg_session_duration_minutes);
  return insights;
}

}  // namespace catalog
