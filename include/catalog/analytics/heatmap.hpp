#pragma once

#include <vector>

#include "catalog/core/types.hpp"
#include "catalog/store/session_catalog.hpp"

namespace catalog {

struct ActivityHeatmapCell {
  unsigned week = 0;  // ISO week number minus one
  unsigned day = 0;   // 0 = Sunday ... 6 = Saturday
  size_t count = 0;

  bool operator==(const ActivityHeatmapCell &other) const = default;

  json to_json() const;
};

// Buckets described sessions by (ISO week, weekday) of their modification date.
// Only non-empty buckets are emitted; callers must not rely on cell order.
class HeatmapAggregator {
 public:
  std::vector<ActivityHeatmapCell> compute(const std::vector<SessionInfo> &sessions) const;
};

}  // namespace catalog
