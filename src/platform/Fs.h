#pragma once

#include <string>
#include <optional>

namespace Platform {

/**
 * Read text file.
 * @param path File path
 * @return File contents as string, or nullopt on error
 */
std::optional<std::string> ReadTextFile(const std::string& path);

/**
 * Write text file, replacing any existing contents.
 * @param path File path
 * @param text Text to write
 * @return true on success
 */
bool WriteTextFile(const std::string& path, const std::string& text);

/**
 * Size of a regular file in bytes.
 * @param path File path
 * @return Size, or nullopt if the file is missing or not a regular file
 */
std::optional<size_t> GetFileSize(const std::string& path);

/**
 * Check if file exists.
 * @param path File path
 * @return true if a regular file exists at path
 */
bool FileExists(const std::string& path);

} // namespace Platform
