#pragma once

// Core types
#include "catalog/core/config.hpp"
#include "catalog/core/message.hpp"
#include "catalog/core/metadata.hpp"
#include "catalog/core/time_format.hpp"
#include "catalog/core/types.hpp"

// Storage
#include "catalog/store/message_log.hpp"
#include "catalog/store/metadata_store.hpp"
#include "catalog/store/path_resolver.hpp"
#include "catalog/store/session_catalog.hpp"
#include "catalog/store/session_store.hpp"

// Analytics
#include "catalog/analytics/heatmap.hpp"
#include "catalog/analytics/insights.hpp"
#include "catalog/analytics/title.hpp"

namespace catalog {

// Initialize logging from the configuration
void init(const Config& config);

// Get version string
std::string version();

}  // namespace catalog
