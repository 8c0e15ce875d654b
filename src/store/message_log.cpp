#include "catalog/store/message_log.hpp"

#include <spdlog/spdlog.h>

#include "store/atomic_file.hpp"

namespace catalog {

namespace fs = std::filesystem;

Result<std::vector<Message>> JsonMessageLog::read(const Location &location) const {
  auto content = detail::read_file(location.messages_file);
  if (!content.ok()) {
    return Result<std::vector<Message>>::failure(*content.error);
  }

  try {
    json j = json::parse(*content.value);
    if (!j.is_array()) {
      return Result<std::vector<Message>>::failure(ErrorKind::CorruptData,
                                                   location.messages_file.string() + " is not a JSON array");
    }
    std::vector<Message> messages;
    messages.reserve(j.size());
    for (const auto &msg_json : j) {
      messages.push_back(Message::from_json(msg_json));
    }
    return Result<std::vector<Message>>::success(std::move(messages));
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse messages file {}: {}", location.messages_file.string(), e.what());
    return Result<std::vector<Message>>::failure(ErrorKind::CorruptData, e.what());
  }
}

Result<size_t> JsonMessageLog::append(const Location &location, const std::vector<Message> &messages) {
  auto mutex = locks_.get(location.dir.string());
  std::lock_guard lock(*mutex);

  std::vector<Message> existing;
  auto current = read(location);
  if (current.ok()) {
    existing = std::move(*current.value);
  } else if (current.kind() != ErrorKind::NotFound) {
    // Never overwrite a log we could not read
    return Result<size_t>::failure(*current.error);
  }

  // Ensure session directory exists
  std::error_code ec;
  fs::create_directories(location.dir, ec);
  if (ec) {
    spdlog::error("Failed to create session directory {}: {}", location.dir.string(), ec.message());
    return Result<size_t>::failure(ErrorKind::IOFailure, "cannot create " + location.dir.string() + ": " + ec.message());
  }

  json j = json::array();
  for (const auto &msg : existing) {
    j.push_back(msg.to_json());
  }
  for (const auto &msg : messages) {
    j.push_back(msg.to_json());
  }

  auto status = detail::atomic_write(location.messages_file, j.dump(2, ' ', false, json::error_handler_t::replace));
  if (status.failed()) {
    return Result<size_t>::failure(*status.error);
  }

  spdlog::debug("Appended {} message(s) to session {}", messages.size(), location.id);
  return Result<size_t>::success(existing.size() + messages.size());
}

bool JsonMessageLog::exists(const Location &location) const {
  std::error_code ec;
  return fs::is_regular_file(location.messages_file, ec);
}

}  // namespace catalog
