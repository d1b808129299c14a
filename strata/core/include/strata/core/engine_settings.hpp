#pragma once

#include <strata/core/log.hpp>
#include <cstdint>
#include <string>

namespace strata::core {

struct UiSettings {
    float default_spacing = 5.0f;
    float default_margin = 10.0f;
    float default_text_size = 16.0f;
    float char_width_factor = 0.6f;   // Approximate glyph advance as a fraction of text size
};

struct InputSettings {
    std::string occlusion = "blanket";  // "blanket" or "hit_test"
};

struct WindowSettings {
    uint32_t width = 1280;
    uint32_t height = 720;
    float scale_factor = 1.0f;
};

struct EngineSettings {
    UiSettings ui;
    InputSettings input;
    WindowSettings window;
    LogLevel log_level = LogLevel::Info;

    // Singleton access
    static EngineSettings& get();

    // Load settings from JSON file
    bool load(const std::string& path);

    // Parse settings from a JSON document
    bool load_from_string(const std::string& content);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    std::string to_json_string() const;

    // Reset to defaults
    void reset();
};

} // namespace strata::core
