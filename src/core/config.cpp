// Tickwise Core
// config.cpp - JSON-based configuration implementation

#include <nlohmann/json.hpp>

#include <tickwise/core/config.hpp>
#include <tickwise/core/logger.hpp>
#include <tickwise/platform/file_io.hpp>

namespace tickwise::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    // Value at section/key, nullptr when absent
    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    template<typename T>
    [[nodiscard]] T get_or(std::string_view section, std::string_view key, T default_value) const {
        const json* value = find(section, key);
        if (value == nullptr) {
            return default_value;
        }
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            TICKWISE_LOG_WARN(log_category::CONFIG, "Config {}.{} has the wrong type ({}), using default",
                              section, key, e.what());
            return default_value;
        }
    }

    template<typename T>
    void set(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        TICKWISE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    TICKWISE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    json parsed = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        TICKWISE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: invalid JSON");
        return false;
    }
    if (!parsed.is_object()) {
        TICKWISE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: top level must be an object");
        return false;
    }

    // Keys missing from the document keep their defaults
    set_defaults();
    impl_->data.merge_patch(parsed);
    impl_->dirty = false;
    return true;
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            TICKWISE_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    if (!platform::FileSystem::write_text(path, impl_->data.dump(4))) {
        TICKWISE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    TICKWISE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        TICKWISE_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (save(path)) {
        impl_->dirty = false;
    } else {
        TICKWISE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }
    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->get_or<int>(section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->get_or<double>(section, key, default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->get_or<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    return impl_->get_or<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->set(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->set(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->set(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->set(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::SCHEDULER, {{config_key::START_PAUSED, false}, {config_key::LOG_ACTIVATIONS, false}}},
                       {config_section::SIMULATION,
                        {{config_key::MAX_TURNS, 100},
                         {config_key::ACTOR_COUNT, 4},
                         {config_key::BASE_SPEED, 1.0},
                         {config_key::SPEED_STEP, 0.5},
                         {config_key::ACTION_COST, 1.0},
                         {config_key::DELAYED_ACTION_DELAY, 10.0}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}}}};
    impl_->dirty = true;
}

}  // namespace tickwise::core
