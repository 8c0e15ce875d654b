// Library initialization
#include "catalog/catalog.hpp"

#include "core/version.hpp"
#include "log/log.h"

namespace catalog {

void init(const Config& config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10 * 1024 * 1024, 10, config.log_level);
}

std::string version() {
  return SESSION_CATALOG_VERSION_STRING;
}

}  // namespace catalog
