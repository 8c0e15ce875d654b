#include "catalog/core/metadata.hpp"

#include <stdexcept>

namespace catalog {

namespace {

json optional_to_json(const std::optional<int64_t> &value) {
  return value ? json(*value) : json(nullptr);
}

json optional_to_json(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

// null and missing both read as absent
template <typename T>
std::optional<T> optional_from_json(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

json SessionMetadata::to_json() const {
  json j;
  j["description"] = description;
  j["message_count"] = message_count;
  j["total_tokens"] = optional_to_json(total_tokens);
  j["input_tokens"] = optional_to_json(input_tokens);
  j["output_tokens"] = optional_to_json(output_tokens);
  j["accumulated_total_tokens"] = optional_to_json(accumulated_total_tokens);
  j["accumulated_input_tokens"] = optional_to_json(accumulated_input_tokens);
  j["accumulated_output_tokens"] = optional_to_json(accumulated_output_tokens);
  j["working_dir"] = working_dir;
  j["schedule_id"] = optional_to_json(schedule_id);
  j["project_id"] = optional_to_json(project_id);
  j["is_title_customized"] = is_title_customized;
  return j;
}

SessionMetadata SessionMetadata::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("metadata must be a JSON object");
  }

  SessionMetadata meta;
  meta.description = j.value("description", "");
  meta.message_count = j.value("message_count", int64_t(0));
  meta.total_tokens = optional_from_json<int64_t>(j, "total_tokens");
  meta.input_tokens = optional_from_json<int64_t>(j, "input_tokens");
  meta.output_tokens = optional_from_json<int64_t>(j, "output_tokens");
  meta.accumulated_total_tokens = optional_from_json<int64_t>(j, "accumulated_total_tokens");
  meta.accumulated_input_tokens = optional_from_json<int64_t>(j, "accumulated_input_tokens");
  meta.accumulated_output_tokens = optional_from_json<int64_t>(j, "accumulated_output_tokens");
  meta.working_dir = j.value("working_dir", "");
  meta.schedule_id = optional_from_json<std::string>(j, "schedule_id");
  meta.project_id = optional_from_json<std::string>(j, "project_id");
  meta.is_title_customized = j.value("is_title_customized", false);
  return meta;
}

}  // namespace catalog
