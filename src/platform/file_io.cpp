// Tickwise Platform Layer
// file_io.cpp - File system helpers implementation

#include <tickwise/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(TICKWISE_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#elif defined(TICKWISE_PLATFORM_MACOS) || defined(TICKWISE_PLATFORM_LINUX)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace tickwise::platform {

namespace {

constexpr const char* APP_DIR = "Tickwise";

#if defined(TICKWISE_PLATFORM_MACOS) || defined(TICKWISE_PLATFORM_LINUX)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::current_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(TICKWISE_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIR;
#elif defined(TICKWISE_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / APP_DIR;
        CoTaskMemFree(path);
        return result;
    }
    return fs::current_path() / "data";
#elif defined(TICKWISE_PLATFORM_LINUX)
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data != nullptr) {
        return fs::path(xdg_data) / APP_DIR;
    }
    return home_directory() / ".local" / "share" / APP_DIR;
#else
    return fs::current_path() / "data";
#endif
}

fs::path FileSystem::get_user_config_directory() {
#if defined(TICKWISE_PLATFORM_LINUX)
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config != nullptr) {
        return fs::path(xdg_config) / APP_DIR;
    }
    return home_directory() / ".config" / APP_DIR;
#elif defined(TICKWISE_PLATFORM_MACOS)
    return get_user_data_directory();
#else
    return get_user_data_directory() / "config";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / APP_DIR;
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
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
        if (path.has_parent_path() && !exists(path.parent_path())) {
            create_directories(path.parent_path());
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
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    const bool result = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), ec.message());
        return false;
    }
    return result;
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::error("Failed to remove '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace tickwise::platform
