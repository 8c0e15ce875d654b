#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "catalog/core/config.hpp"

namespace catalog {

namespace {

constexpr const char* kLogBaseName = "session_catalog";

// app.log -> app.{index}.log
std::filesystem::path backup_name(const std::filesystem::path& current_log, size_t index) {
  auto name = current_log.stem().string() + "." + std::to_string(index) + current_log.extension().string();
  return current_log.parent_path() / name;
}

// 每次启动时轮转日志文件
// 策略：session_catalog.log -> session_catalog.0.log -> ...（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  std::error_code ec;

  fs::remove(backup_name(current_log, max_files - 1), ec);

  for (size_t i = max_files - 1; i-- > 0;) {
    auto old_name = backup_name(current_log, i);
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup_name(current_log, i + 1), ec);
    }
  }

  fs::rename(current_log, backup_name(current_log, 0), ec);
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t /* max_size */, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path =
        log_path.empty() ? config_paths::config_dir() / "log" / (std::string(kLogBaseName) + ".log") : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>(kLogBaseName, file_sink);

    logger->set_level(parse_level(level));

    // 日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLogBaseName);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== session catalog started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace catalog
