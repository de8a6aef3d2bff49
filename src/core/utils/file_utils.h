#pragma once

#include <string>
#include <string_view>

#include "../types.h"

namespace sc {
namespace file {

// Whole file as text. Fails on missing paths and directories.
Result<std::string> readText(const Path& path);

// Replace the file contents atomically: the text goes to a sibling temp file
// which is then renamed over the target. Missing parent directories are created.
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

bool exists(const Path& path);
bool isFile(const Path& path);
[[nodiscard]] bool createDirectories(const Path& path);

} // namespace file
} // namespace sc
