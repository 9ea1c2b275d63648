// Tessera Core
// config.cpp - JSON-based configuration implementation

#include <nlohmann/json.hpp>

#include <tessera/core/config.hpp>
#include <tessera/core/logger.hpp>
#include <tessera/platform/file_io.hpp>

namespace tessera::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

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

    template <typename T>
    [[nodiscard]] T get_or(std::string_view section, std::string_view key, T default_value) const {
        const json* value = find(section, key);
        if (value == nullptr) {
            return default_value;
        }
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            TESSERA_LOG_WARN(log_category::CONFIG, "Config {}.{} has wrong type ({}), using default", section, key,
                             e.what());
            return default_value;
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
    impl_->dirty = false;
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        TESSERA_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    TESSERA_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            TESSERA_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        // Loaded values override the defaults section by section
        set_defaults();
        for (auto& [section, values] : parsed.items()) {
            if (values.is_object() && impl_->data.contains(section) && impl_->data[section].is_object()) {
                impl_->data[section].update(values);
            } else {
                impl_->data[section] = values;
            }
        }
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        TESSERA_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            TESSERA_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    if (!platform::FileSystem::write_text(path, dump())) {
        TESSERA_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    TESSERA_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        TESSERA_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
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

    if (!save(path)) {
        TESSERA_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
        return true;
    }
    impl_->dirty = false;
    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

std::string Config::dump() const {
    return impl_->data.dump(4);
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->get_or<int>(section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->get_or<double>(section, key, default_value);
}

float Config::get_float(std::string_view section, std::string_view key, float default_value) const {
    return static_cast<float>(get_double(section, key, static_cast<double>(default_value)));
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->get_or<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->get_or<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_changed(section, key);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_changed(section, key);
}

void Config::set_float(std::string_view section, std::string_view key, float value) {
    set_double(section, key, static_cast<double>(value));
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_changed(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    notify_changed(section, key);
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

bool Config::remove_section(std::string_view section) {
    if (!has_section(section)) {
        return false;
    }
    impl_->data.erase(std::string(section));
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
    impl_->data = json{{config_section::WINDOW,
                        {{config_key::WIDTH, 960}, {config_key::HEIGHT, 600}, {config_key::VSYNC, true}}},
                       {config_section::GRID, {{config_key::WIDTH, 80}, {config_key::HEIGHT, 25}}},
                       {config_section::RENDERER,
                        {{config_key::FRAMES_IN_FLIGHT, 2},
                         {config_key::INSTANCE_SLACK_FACTOR, 1.5},
                         {config_key::SCALE_MODE, "fit"},
                         {config_key::SCREEN_FILTER, "nearest"},
                         {config_key::POST_PROCESSING, false},
                         {config_key::CLEAR_COLOR, "#000000ff"},
                         {config_key::INTERMEDIATE_CLEAR_COLOR, "#1a0000ff"},
                         {config_key::OFFSCREEN, false}}},
                       {config_section::DEBUG,
                        {{config_key::LOG_LEVEL, "info"}, {config_key::FPS_LOG_INTERVAL, 1000}}}};
    impl_->dirty = true;
}

void Config::notify_changed(std::string_view section, std::string_view key) {
    impl_->dirty = true;
    if (impl_->change_callback) {
        impl_->change_callback(section, key);
    }
}

}  // namespace tessera::core
