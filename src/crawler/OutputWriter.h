#pragma once

#include <filesystem>
#include <string>

namespace site_mirror::crawler {

// Writes content to root/relativePath, creating parent directories and
// replacing an existing file. Failures are logged and reported as false.
bool writeOutputFile(const std::filesystem::path& root,
                     const std::string& relativePath,
                     const std::string& content);

} // namespace site_mirror::crawler
