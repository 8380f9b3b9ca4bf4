#pragma once

#include <string>
#include <optional>

namespace netlaunch {

bool file_exists(const std::string& path);

/**
 * Read a whole file as text
 * @return file content, or std::nullopt if it cannot be opened or read
 */
std::optional<std::string> read_file_text(const std::string& path);

/**
 * Create or truncate a file and write content to it
 */
bool create_file(const std::string& path, const std::string& content);

/**
 * Create an executable file (mode 0755), used for helper scripts
 */
bool create_executable_file(const std::string& path, const std::string& content);

bool delete_file(const std::string& path);

} // namespace netlaunch
