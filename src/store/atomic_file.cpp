#include "store/atomic_file.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

namespace catalog::detail {

namespace fs = std::filesystem;

namespace {

// Unique per process, thread and call so concurrent writers never share a temp file
std::string temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  std::ostringstream oss;
  oss << ".tmp." << ::getpid() << '.' << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.'
      << counter.fetch_add(1, std::memory_order_relaxed);
  return oss.str();
}

}  // namespace

Status atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += temp_suffix();

  std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    spdlog::error("Failed to open temp file for writing: {}", tmp_path.string());
    return Status::failure(ErrorKind::IOFailure, "cannot open " + tmp_path.string());
  }

  file << content;
  file.flush();
  file.close();

  std::error_code ec;
  if (file.fail()) {
    spdlog::error("Failed to write temp file: {}", tmp_path.string());
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorKind::IOFailure, "cannot write " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    spdlog::error("Failed to rename temp file {} -> {}: {}", tmp_path.string(), path.string(), ec.message());
    std::error_code remove_ec;
    fs::remove(tmp_path, remove_ec);
    return Status::failure(ErrorKind::IOFailure, "cannot replace " + path.string() + ": " + ec.message());
  }

  return Status::success();
}

Result<std::string> read_file(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      return Result<std::string>::failure(ErrorKind::IOFailure, "cannot stat " + path.string() + ": " + ec.message());
    }
    return Result<std::string>::failure(ErrorKind::NotFound, path.string() + " does not exist");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    spdlog::warn("Failed to open file: {}", path.string());
    return Result<std::string>::failure(ErrorKind::IOFailure, "cannot open " + path.string());
  }

  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure(ErrorKind::IOFailure, "cannot read " + path.string());
  }
  return Result<std::string>::success(oss.str());
}

}  // namespace catalog::detail
