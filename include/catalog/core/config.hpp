#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "catalog/core/types.hpp"

namespace catalog {

// Application configuration
struct Config {
  // Catalog root directory, one subdirectory per session
  std::filesystem::path root;

  // Derive a description from the first user message while the title is not customized
  bool auto_title = false;
  size_t title_max_chars = 50;

  // Insights settings
  struct InsightsSettings {
    size_t top_dirs = 3;
    size_t recent_days = 7;
  } insights;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  Config();

  // Load from file; a missing or malformed file yields defaults
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: SESSION_CATALOG_ROOT, SESSION_CATALOG_LOG_LEVEL
  static Config from_env();

  // Save to file
  Status save(const std::filesystem::path& path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_sessions_dir();
}  // namespace config_paths

}  // namespace catalog
