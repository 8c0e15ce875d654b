#include "catalog/core/lock_table.hpp"

namespace catalog {

std::shared_ptr<std::mutex> LockTable::get(const std::string &key) {
  std::lock_guard lock(mutex_);
  auto &entry = locks_[key];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

size_t LockTable::size() const {
  std::lock_guard lock(mutex_);
  return locks_.size();
}

}  // namespace catalog
