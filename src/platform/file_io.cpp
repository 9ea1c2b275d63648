// Tessera Platform Layer
// file_io.cpp - File system helpers implementation

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <tessera/platform/file_io.hpp>

#if defined(TESSERA_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace tessera::platform {

namespace {

#if !defined(TESSERA_PLATFORM_WINDOWS)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::temp_directory_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(TESSERA_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / "Tessera";
#elif defined(TESSERA_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / "Tessera";
        CoTaskMemFree(path);
        return result;
    }
    return fs::current_path() / "data";
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr) {
        return fs::path(xdg_data) / "Tessera";
    }
    return home_directory() / ".local" / "share" / "Tessera";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "Tessera";
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }
        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path() && !exists(path.parent_path()) && !create_directories(path.parent_path())) {
            return false;
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;
        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    try {
        fs::create_directories(path);
        return fs::is_directory(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::exists(const fs::path& path) {
    try {
        return fs::exists(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove_all(const fs::path& path) {
    try {
        fs::remove_all(path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove '{}': {}", path.string(), e.what());
        return false;
    }
}

}  // namespace tessera::platform
