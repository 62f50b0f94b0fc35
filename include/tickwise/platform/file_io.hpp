// Tickwise Platform Layer
// file_io.hpp - File system helpers for config and log files

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tickwise::platform {

namespace fs = std::filesystem;

// Static utility class; failures are logged and reported through the return value
class FileSystem {
public:
    // Standard paths
    static fs::path get_user_data_directory();    // $XDG_DATA_HOME/Tickwise on Linux
    static fs::path get_user_config_directory();  // $XDG_CONFIG_HOME/Tickwise on Linux
    static fs::path get_temp_directory();

    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace tickwise::platform
