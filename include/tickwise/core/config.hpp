// Tickwise Core
// config.hpp - JSON-based configuration

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tickwise::core {

// Sectioned key/value configuration persisted as JSON
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view json_text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters; a missing key or a type mismatch yields the default
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key,
                                bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* SCHEDULER = "scheduler";
    inline constexpr const char* SIMULATION = "simulation";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Scheduler section
    inline constexpr const char* START_PAUSED = "start_paused";
    inline constexpr const char* LOG_ACTIVATIONS = "log_activations";

    // Simulation section
    inline constexpr const char* MAX_TURNS = "max_turns";
    inline constexpr const char* ACTOR_COUNT = "actor_count";
    inline constexpr const char* BASE_SPEED = "base_speed";
    inline constexpr const char* SPEED_STEP = "speed_step";
    inline constexpr const char* ACTION_COST = "action_cost";
    inline constexpr const char* DELAYED_ACTION_DELAY = "delayed_action_delay";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace tickwise::core
