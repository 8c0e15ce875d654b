#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "catalog/core/types.hpp"

namespace catalog {

// Format of SessionInfo::modified, always UTC
inline constexpr const char* kModifiedTimeFormat = "%Y-%m-%d %H:%M:%S UTC";

// Calendar date used for activity buckets
inline constexpr const char* kDateFormat = "%Y-%m-%d";

std::string format_utc(Timestamp ts);

// Parses a kModifiedTimeFormat string; nullopt when it does not match exactly
std::optional<std::chrono::sys_seconds> parse_utc(const std::string& text);

std::string format_date(std::chrono::sys_days day);

// ISO-8601 week number, 1..53
unsigned iso_week_number(std::chrono::sys_days day);

// 0 = Sunday ... 6 = Saturday
unsigned weekday_from_sunday(std::chrono::sys_days day);

}  // namespace catalog
