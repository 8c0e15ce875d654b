#include "catalog/store/metadata_store.hpp"

#include <spdlog/spdlog.h>

#include "store/atomic_file.hpp"

namespace catalog {

namespace fs = std::filesystem;

namespace {

Status require_session_dir(const Location &location) {
  std::error_code ec;
  if (fs::is_directory(location.dir, ec)) {
    return Status::success();
  }
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return Status::failure(ErrorKind::IOFailure, "cannot stat " + location.dir.string() + ": " + ec.message());
  }
  return Status::failure(ErrorKind::NotFound, "session " + location.id + " does not exist");
}

}  // namespace

Result<std::optional<SessionMetadata>> MetadataStore::load(const Location &location) const {
  using R = Result<std::optional<SessionMetadata>>;

  auto content = detail::read_file(location.metadata_file);
  if (!content.ok()) {
    if (content.kind() == ErrorKind::NotFound) {
      return R::success(std::nullopt);
    }
    return R::failure(*content.error);
  }

  try {
    return R::success(SessionMetadata::from_json(json::parse(*content.value)));
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse metadata file {}: {}", location.metadata_file.string(), e.what());
    return R::failure(ErrorKind::CorruptData, location.metadata_file.string() + ": " + e.what());
  }
}

Result<SessionMetadata> MetadataStore::read(const Location &location) const {
  auto loaded = load(location);
  if (!loaded.ok()) {
    return Result<SessionMetadata>::failure(*loaded.error);
  }
  return Result<SessionMetadata>::success(loaded.value->value_or(SessionMetadata{}));
}

Status MetadataStore::write(const Location &location, const SessionMetadata &metadata) {
  auto mutex = locks_.get(location.dir.string());
  std::lock_guard lock(*mutex);

  auto exists = require_session_dir(location);
  if (exists.failed()) {
    return exists;
  }
  return commit(location, metadata);
}

Result<SessionMetadata> MetadataStore::update(const Location &location, const Mutator &mutate) {
  auto mutex = locks_.get(location.dir.string());
  std::lock_guard lock(*mutex);

  auto exists = require_session_dir(location);
  if (exists.failed()) {
    return Result<SessionMetadata>::failure(*exists.error);
  }

  auto loaded = load(location);
  if (!loaded.ok()) {
    return Result<SessionMetadata>::failure(*loaded.error);
  }

  SessionMetadata metadata = loaded.value->value_or(SessionMetadata{});
  if (!loaded.value->has_value()) {
    spdlog::debug("Session {} has no metadata yet, starting from defaults", location.id);
  }

  mutate(metadata);

  auto status = commit(location, metadata);
  if (status.failed()) {
    return Result<SessionMetadata>::failure(*status.error);
  }
  return Result<SessionMetadata>::success(std::move(metadata));
}

Status MetadataStore::commit(const Location &location, const SessionMetadata &metadata) {
  auto status =
      detail::atomic_write(location.metadata_file, metadata.to_json().dump(2, ' ', false, json::error_handler_t::replace));
  if (status.failed()) {
    spdlog::error("Failed to update metadata for session {}: {}", location.id, status.error->message);
  }
  return status;
}

}  // namespace catalog
