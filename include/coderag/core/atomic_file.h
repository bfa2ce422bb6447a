#pragma once

#include <coderag/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace coderag {

/**
 * @brief Write a whole file through a sibling temp file and rename().
 *
 * Readers see either the previous content or the new one, never a partial write.
 */
Result<void> atomicWrite(const std::filesystem::path& path, std::string_view content);

// FileNotFound when the file does not exist
Result<std::string> readFile(const std::filesystem::path& path);

} // namespace coderag
