#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace catalog {

// Per-key mutexes for serializing writers of one session.
//
// The table's own mutex guards only the lookup; the returned per-key mutex
// is what callers hold across storage work, so writers of different keys
// never wait on each other. Entries live as long as the table.
class LockTable {
 public:
  std::shared_ptr<std::mutex> get(const std::string &key);

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace catalog
