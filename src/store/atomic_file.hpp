#pragma once

#include <filesystem>
#include <string>

#include "catalog/core/types.hpp"

namespace catalog::detail {

// Atomic write: write to a sibling temp file, flush, then rename over path.
// Readers see either the previous content or the new content, never a mix.
Status atomic_write(const std::filesystem::path &path, const std::string &content);

// Reads a whole file. NotFound if it does not exist, IOFailure if it cannot be read.
Result<std::string> read_file(const std::filesystem::path &path);

}  // namespace catalog::detail
