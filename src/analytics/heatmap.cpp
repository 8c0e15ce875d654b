#include "catalog/analytics/heatmap.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

#include "catalog/core/time_format.hpp"

namespace catalog {

json ActivityHeatmapCell::to_json() const {
  return json{{"week", week}, {"day", day}, {"count", count}};
}

std::vector<ActivityHeatmapCell> HeatmapAggregator::compute(const std::vector<SessionInfo> &sessions) const {
  // (week, day) -> count
  std::map<std::pair<unsigned, unsigned>, size_t> buckets;

  for (const auto &session : sessions) {
    if (session.metadata.description.empty()) continue;

    auto modified = parse_utc(session.modified);
    if (!modified) {
      spdlog::debug("Session {} has unparsable modified time '{}'", session.id, session.modified);
      continue;
    }

    auto date = std::chrono::floor<std::chrono::days>(*modified);
    ++buckets[{iso_week_number(date) - 1, weekday_from_sunday(date)}];
  }

  std::vector<ActivityHeatmapCell> cells;
  cells.reserve(buckets.size());
  for (const auto &[key, count] : buckets) {
    cells.push_back(ActivityHeatmapCell{key.first, key.second, count});
  }
  return cells;
}

}  // namespace catalog
