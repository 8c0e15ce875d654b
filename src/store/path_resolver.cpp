#include "catalog/store/path_resolver.hpp"

namespace catalog {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxIdLength = 255;

}  // namespace

PathResolver::PathResolver(fs::path root) : root_(std::move(root)) {}

bool PathResolver::is_valid(const SessionId &id) {
  if (id.empty() || id.size() > kMaxIdLength) {
    return false;
  }
  // Also rules out "." and ".." and hidden/temp names
  if (id.front() == '.') {
    return false;
  }
  if (id.find("..") != std::string::npos) {
    return false;
  }
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0' || c == ':') {
      return false;
    }
  }
  return true;
}

Result<Location> PathResolver::resolve(const SessionId &id) const {
  if (!is_valid(id)) {
    return Result<Location>::failure(ErrorKind::InvalidIdentifier, "invalid session id: '" + id + "'");
  }

  Location loc;
  loc.id = id;
  loc.dir = root_ / id;
  loc.messages_file = loc.dir / kMessagesFileName;
  loc.metadata_file = loc.dir / kMetadataFileName;
  return Result<Location>::success(std::move(loc));
}

}  // namespace catalog
