#include "Fs.h"
#include <fstream>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace Platform {

std::optional<std::string> ReadTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

bool WriteTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    
    file << text;
    return file.good();
}

std::optional<size_t> GetFileSize(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<size_t>(size);
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace Platform
