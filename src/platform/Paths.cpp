#include "Paths.h"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace Platform {

std::string GetUserDataDir() {
#ifdef __APPLE__
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support/Planform/";
    }
#elif defined(_WIN32)
    const char* appdata = getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\Planform\\";
    }
#else
    const char* xdg = getenv("XDG_DATA_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/planform/";
    }
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/.local/share/planform/";
    }
#endif
    return "./userdata/";
}

bool EnsureDirectoryExists(const std::string& path) {
    std::error_code ec;
    fs::path normalized = fs::path(path).lexically_normal();
    
    // Idempotent: an existing directory is not an error
    fs::create_directories(normalized, ec);
    if (ec) {
        return false;
    }
    return fs::is_directory(normalized, ec);
}

} // namespace Platform
