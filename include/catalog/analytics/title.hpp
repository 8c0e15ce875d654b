#pragma once

#include <string>
#include <vector>

#include "catalog/core/message.hpp"

namespace catalog {

// Short session title derived from free text: whole words up to max_chars
// followed by "...", or a hard cut when even the first word does not fit.
std::string suggest_title(const std::string &text, size_t max_chars = 50);

// Title from the first non-blank user message, empty if there is none
std::string suggest_title(const std::vector<Message> &messages, size_t max_chars = 50);

}  // namespace catalog
