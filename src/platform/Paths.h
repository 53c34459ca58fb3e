#pragma once

#include <string>

namespace Platform {

/**
 * Get the user data directory for persistent storage.
 * macOS: ~/Library/Application Support/Planform/
 * Windows: %APPDATA%\Planform\
 * Linux: $XDG_DATA_HOME/planform/ or ~/.local/share/planform/
 * @return Path to user data directory (with trailing separator)
 */
std::string GetUserDataDir();

/**
 * Ensure a directory exists, creating it if necessary.
 * @param path Directory path
 * @return true if directory exists or was created successfully
 */
bool EnsureDirectoryExists(const std::string& path);

} // namespace Platform
