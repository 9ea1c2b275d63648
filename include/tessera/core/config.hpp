// Tessera Core
// config.hpp - JSON-based configuration

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tessera::core {

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
    bool load_from_string(std::string_view text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;
    [[nodiscard]] std::string dump() const;

    // Typed getters with defaults
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] float get_float(std::string_view section, std::string_view key, float default_value = 0.0f) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_float(std::string_view section, std::string_view key, float value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void notify_changed(std::string_view section, std::string_view key);
};

namespace config_section {
inline constexpr const char* WINDOW = "window";
inline constexpr const char* GRID = "grid";
inline constexpr const char* RENDERER = "renderer";
inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
// Window / grid sections. window.width/height feed FrameOrchestratorConfig::from_config.
// grid.width/height and window.vsync are read by the host application, which owns the
// CellGrid and creates the device; the library only stores their defaults.
inline constexpr const char* WIDTH = "width";
inline constexpr const char* HEIGHT = "height";
inline constexpr const char* VSYNC = "vsync";

// Renderer section
inline constexpr const char* FRAMES_IN_FLIGHT = "frames_in_flight";
inline constexpr const char* INSTANCE_SLACK_FACTOR = "instance_slack_factor";
inline constexpr const char* SCALE_MODE = "scale_mode";
inline constexpr const char* SCREEN_FILTER = "screen_filter";
inline constexpr const char* POST_PROCESSING = "post_processing";
inline constexpr const char* CLEAR_COLOR = "clear_color";
inline constexpr const char* INTERMEDIATE_CLEAR_COLOR = "intermediate_clear_color";
inline constexpr const char* OFFSCREEN = "offscreen";

// Debug section
inline constexpr const char* LOG_LEVEL = "log_level";  // LoggerConfig::from_config
inline constexpr const char* FPS_LOG_INTERVAL = "fps_log_interval";
}  // namespace config_key

}  // namespace tessera::core
