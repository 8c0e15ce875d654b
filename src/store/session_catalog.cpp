#include "catalog/store/session_catalog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "catalog/core/time_format.hpp"

namespace catalog {

namespace fs = std::filesystem;

std::string to_string(SortOrder order) {
  switch (order) {
    case SortOrder::Ascending:
      return "ascending";
    case SortOrder::Descending:
      return "descending";
  }
  return "descending";
}

SortOrder sort_order_from_string(const std::string &str) {
  if (str == "asc" || str == "ascending") return SortOrder::Ascending;
  return SortOrder::Descending;
}

json SessionInfo::to_json() const {
  json j;
  j["id"] = id;
  j["modified"] = modified;
  j["metadata"] = metadata.to_json();
  return j;
}

namespace {

// Latest write time of the session's files; nullopt if neither exists
std::optional<Timestamp> last_modified(const Location &loc) {
  std::optional<Timestamp> latest;
  for (const auto &file : {loc.messages_file, loc.metadata_file}) {
    std::error_code ec;
    auto ftime = fs::last_write_time(file, ec);
    if (ec) {
      continue;
    }
    auto ts = std::chrono::time_point_cast<Timestamp::duration>(std::chrono::file_clock::to_sys(ftime));
    if (!latest || ts > *latest) {
      latest = ts;
    }
  }
  return latest;
}

}  // namespace

SessionCatalog::SessionCatalog(const PathResolver &resolver, const MetadataStore &metadata)
    : resolver_(resolver), metadata_(metadata) {}

Result<std::vector<SessionInfo>> SessionCatalog::list(SortOrder order) const {
  using R = Result<std::vector<SessionInfo>>;
  const auto &root = resolver_.root();

  std::error_code ec;
  if (!fs::exists(root, ec)) {
    if (ec) {
      return R::failure(ErrorKind::IOFailure, "cannot stat catalog root " + root.string() + ": " + ec.message());
    }
    return R::success({});
  }

  fs::directory_iterator it(root, ec);
  if (ec) {
    spdlog::error("Failed to enumerate catalog root {}: {}", root.string(), ec.message());
    return R::failure(ErrorKind::IOFailure, "cannot enumerate " + root.string() + ": " + ec.message());
  }

  std::vector<fs::path> dirs;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      dirs.push_back(it->path());
    }
  }
  if (ec) {
    spdlog::error("Failed while enumerating catalog root {}: {}", root.string(), ec.message());
    return R::failure(ErrorKind::IOFailure, "cannot enumerate " + root.string() + ": " + ec.message());
  }

  std::vector<SessionInfo> sessions;
  for (const auto &dir : dirs) {
    auto name = dir.filename().string();
    auto loc = resolver_.resolve(name);
    if (!loc.ok()) {
      spdlog::debug("Skipping catalog entry with invalid session id: {}", name);
      continue;
    }

    auto modified = last_modified(*loc.value);
    if (!modified) {
      spdlog::debug("Skipping empty session directory: {}", name);
      continue;
    }

    auto metadata = metadata_.read(*loc.value);
    if (!metadata.ok()) {
      spdlog::warn("Skipping session {}: {} ({})", name, metadata.error->message, to_string(metadata.kind()));
      continue;
    }

    sessions.push_back(SessionInfo{name, format_utc(*modified), std::move(*metadata.value)});
  }

  // The fixed-width timestamp format orders lexicographically
  std::sort(sessions.begin(), sessions.end(), [order](const SessionInfo &a, const SessionInfo &b) {
    if (a.modified != b.modified) {
      return order == SortOrder::Ascending ? a.modified < b.modified : a.modified > b.modified;
    }
    return a.id < b.id;
  });

  return R::success(std::move(sessions));
}

}  // namespace catalog
