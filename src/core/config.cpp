#include "catalog/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace catalog {

namespace fs = std::filesystem;

Config::Config() : root(config_paths::default_sessions_dir()) {}

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file: {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("root")) {
      config.root = j["root"].get<std::string>();
    }

    config.auto_title = j.value("auto_title", false);
    config.title_max_chars = j.value("title_max_chars", size_t(50));

    // Load insights settings
    if (j.contains("insights")) {
      const auto& ins = j["insights"];
      config.insights.top_dirs = ins.value("top_dirs", size_t(3));
      config.insights.recent_days = ins.value("recent_days", size_t(7));
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* root = std::getenv("SESSION_CATALOG_ROOT"); root && *root) {
    config.root = root;
  }
  if (const char* level = std::getenv("SESSION_CATALOG_LOG_LEVEL"); level && *level) {
    config.log_level = level;
  }

  return config;
}

Status Config::save(const fs::path& path) const {
  json j;
  j["root"] = root.string();
  j["auto_title"] = auto_title;
  j["title_max_chars"] = title_max_chars;
  j["insights"] = {{"top_dirs", insights.top_dirs}, {"recent_days", insights.recent_days}};
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::IOFailure, "cannot open " + path.string());
  }
  file << j.dump(2);
  if (!file) {
    return Status::failure(ErrorKind::IOFailure, "cannot write " + path.string());
  }
  return Status::success();
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "session-catalog";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".session-catalog" / "config.json";
}

fs::path default_sessions_dir() {
  return config_dir() / "sessions";
}

}  // namespace config_paths

}  // namespace catalog
