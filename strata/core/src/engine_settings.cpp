#include <strata/core/engine_settings.hpp>
#include <strata/core/filesystem.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

namespace strata::core {

using json = nlohmann::json;

namespace {

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return fallback;
}

} // anonymous namespace

EngineSettings& EngineSettings::get() {
    static EngineSettings instance;
    return instance;
}

bool EngineSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "EngineSettings: could not read '{}'", path);
        return false;
    }
    return load_from_string(content);
}

bool EngineSettings::load_from_string(const std::string& content) {
    // Applied only once every section has parsed
    EngineSettings parsed = *this;

    try {
        json j = json::parse(content);

        if (j.contains("ui")) {
            auto& u = j["ui"];
            parsed.ui.default_spacing = u.value("default_spacing", ui.default_spacing);
            parsed.ui.default_margin = u.value("default_margin", ui.default_margin);
            parsed.ui.default_text_size = u.value("default_text_size", ui.default_text_size);
            parsed.ui.char_width_factor = u.value("char_width_factor", ui.char_width_factor);
        }

        if (j.contains("input")) {
            auto& i = j["input"];
            parsed.input.occlusion = i.value("occlusion", input.occlusion);
        }

        if (j.contains("window")) {
            auto& w = j["window"];
            parsed.window.width = w.value("width", window.width);
            parsed.window.height = w.value("height", window.height);
            parsed.window.scale_factor = w.value("scale_factor", window.scale_factor);
        }

        if (j.contains("log")) {
            auto& l = j["log"];
            std::string level = l.value("level", std::string(log_level_name(log_level)));
            parsed.log_level = parse_log_level(level, log_level);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Warn, "EngineSettings: malformed settings ({})", e.what());
        return false;
    }

    *this = parsed;
    return true;
}

bool EngineSettings::save(const std::string& path) const {
    if (!FileSystem::write_text(path, to_json_string())) {
        log(LogLevel::Warn, "EngineSettings: could not write '{}'", path);
        return false;
    }
    return true;
}

std::string EngineSettings::to_json_string() const {
    json j;

    j["ui"] = {
        {"default_spacing", ui.default_spacing},
        {"default_margin", ui.default_margin},
        {"default_text_size", ui.default_text_size},
        {"char_width_factor", ui.char_width_factor}
    };

    j["input"] = {
        {"occlusion", input.occlusion}
    };

    j["window"] = {
        {"width", window.width},
        {"height", window.height},
        {"scale_factor", window.scale_factor}
    };

    j["log"] = {
        {"level", log_level_name(log_level)}
    };

    return j.dump(4);
}

void EngineSettings::reset() {
    *this = EngineSettings{};
}

} // namespace strata::core
