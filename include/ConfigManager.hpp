#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace venue_guard {

struct CheckerConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%H:%M:%S] [%^%l%$] %v";
    bool require_map_point = false;
    bool pretty = false;

    static CheckerConfig from_json(const nlohmann::json& j) {
        CheckerConfig c;
        c.log_level = j.value("log_level", c.log_level);
        c.log_pattern = j.value("log_pattern", c.log_pattern);
        c.require_map_point = j.value("require_map_point", c.require_map_point);
        c.pretty = j.value("pretty", c.pretty);
        return c;
    }
};

class ConfigManager {
public:
    // Loads from `explicit_path` if given, else from the first default location found.
    // Returns nullopt only when an explicit path can't be opened.
    static std::optional<CheckerConfig> load(const std::string& explicit_path = "") {
        std::ifstream f;
        std::string used_path;

        if (!explicit_path.empty()) {
            f.open(explicit_path);
            if (!f.is_open()) {
                spdlog::error("Config file {} cannot be opened", explicit_path);
                return std::nullopt;
            }
            used_path = explicit_path;
        } else {
            for (const auto& path : search_paths()) {
                f.open(path);
                if (f.is_open()) {
                    used_path = path;
                    break;
                }
            }
        }

        if (!f.is_open()) {
            spdlog::warn("⚠️ venue_check.json not found, using defaults");
            return CheckerConfig{};
        }

        try {
            auto j = nlohmann::json::parse(f);
            if (!j.is_object()) {
                spdlog::error("💥 {} is not a JSON object, using defaults", used_path);
                return CheckerConfig{};
            }
            auto config = CheckerConfig::from_json(j);
            spdlog::info("Config loaded from {}", used_path);
            return config;
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", used_path, e.what());
            return CheckerConfig{};
        }
    }

    static void apply_logging(const CheckerConfig& config) {
        auto level = spdlog::level::from_str(config.log_level);
        if (level == spdlog::level::off && config.log_level != "off") {
            spdlog::warn("Unknown log_level '{}', keeping info", config.log_level);
            level = spdlog::level::info;
        }
        spdlog::set_level(level);
        spdlog::set_pattern(config.log_pattern);
    }

private:
    static std::vector<std::string> search_paths() {
        return {
            "venue_check.json", "../venue_check.json", "config/venue_check.json", "build/venue_check.json"
        };
    }
};

}
