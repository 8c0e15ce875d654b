#pragma once

#include <vector>

#include "catalog/core/lock_table.hpp"
#include "catalog/core/message.hpp"
#include "catalog/core/types.hpp"
#include "catalog/store/path_resolver.hpp"

namespace catalog {

// Ordered, append-oriented message log of one session
class MessageLog {
 public:
  virtual ~MessageLog() = default;

  // Extends the log, creating it on first use. Either all messages land or
  // none do. Returns the length of the log after the append.
  virtual Result<size_t> append(const Location &location, const std::vector<Message> &messages) = 0;

  // NotFound if no log exists, CorruptData if it cannot be parsed
  virtual Result<std::vector<Message>> read(const Location &location) const = 0;

  virtual bool exists(const Location &location) const = 0;
};

// Message log kept as a JSON array in {session}/messages.json.
// Appends rewrite the whole array through a temp file and rename.
class JsonMessageLog : public MessageLog {
 public:
  JsonMessageLog() = default;

  Result<size_t> append(const Location &location, const std::vector<Message> &messages) override;
  Result<std::vector<Message>> read(const Location &location) const override;
  bool exists(const Location &location) const override;

 private:
  LockTable locks_;
};

}  // namespace catalog
