#include "termtoast/toast_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace termtoast {

namespace fs = std::filesystem;

namespace {

// Reads a non-negative millisecond count; throws on a wrong type
void read_duration(const nlohmann::json& json, const char* key, Duration& out) {
    if (!json.contains(key)) {
        return;
    }
    int64_t ms = json.at(key).get<int64_t>();
    if (ms < 0) {
        throw std::invalid_argument(std::string("durations_ms.") + key + " must not be negative");
    }
    out = Duration(ms);
}

template <typename Enum>
Enum read_enum(const nlohmann::json& json, const char* key, Enum current,
               std::optional<Enum> (*parse)(const std::string&)) {
    if (!json.contains(key)) {
        return current;
    }
    std::string text = json.at(key).get<std::string>();
    std::optional<Enum> value = parse(text);
    if (!value) {
        throw std::invalid_argument(std::string("unknown ") + key + " value: " + text);
    }
    return *value;
}

} // anonymous namespace

void ToastConfig::reset_to_defaults() {
    m_max_concurrent.reset();
    m_overflow = Overflow::DiscardOldest;
    m_overflow_scope = OverflowScope::Global;
    m_defaults = ManagerDefaults{};
    m_modified = true;
}

bool ToastConfig::load(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        // No config file yet, keep defaults
        std::cout << "[termtoast] Config not found, using defaults: " << config_path << std::endl;
        return true;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[termtoast] Failed to open config: " << config_path << std::endl;
            return false;
        }

        nlohmann::json json;
        file >> json;

        if (!json.is_object()) {
            std::cerr << "[termtoast] Config root must be an object: " << config_path << std::endl;
            return false;
        }

        // Parse into locals first so a bad value leaves everything untouched
        std::optional<size_t> max_concurrent = m_max_concurrent;
        if (json.contains("max_concurrent")) {
            const auto& value = json.at("max_concurrent");
            if (value.is_null()) {
                max_concurrent.reset();
            } else if (value.is_number_unsigned()) {
                max_concurrent = value.get<size_t>();
            } else {
                throw std::invalid_argument("max_concurrent must be a non-negative integer or null");
            }
        }

        Overflow overflow = read_enum(json, "overflow", m_overflow, &overflow_from_string);
        OverflowScope scope = read_enum(json, "overflow_scope", m_overflow_scope, &overflow_scope_from_string);

        ManagerDefaults defaults = m_defaults;
        if (json.contains("durations_ms")) {
            const auto& durations = json.at("durations_ms");
            if (!durations.is_object()) {
                throw std::invalid_argument("durations_ms must be an object");
            }
            read_duration(durations, "slide", defaults.slide_duration);
            read_duration(durations, "expand_collapse", defaults.expand_collapse_duration);
            read_duration(durations, "fade", defaults.fade_duration);
        }

        m_max_concurrent = max_concurrent;
        m_overflow = overflow;
        m_overflow_scope = scope;
        m_defaults = defaults;
        m_modified = false;

        std::cout << "[termtoast] Loaded config from: " << config_path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[termtoast] Error loading config: " << e.what() << std::endl;
        return false;
    }
}

bool ToastConfig::save(const fs::path& config_path) const {
    try {
        nlohmann::json json;

        if (m_max_concurrent) {
            json["max_concurrent"] = *m_max_concurrent;
        } else {
            json["max_concurrent"] = nullptr;
        }
        json["overflow"] = to_string(m_overflow);
        json["overflow_scope"] = to_string(m_overflow_scope);
        json["durations_ms"] = {
            {"slide", m_defaults.slide_duration.count()},
            {"expand_collapse", m_defaults.expand_collapse_duration.count()},
            {"fade", m_defaults.fade_duration.count()}
        };

        if (config_path.has_parent_path()) {
            fs::create_directories(config_path.parent_path());
        }

        std::ofstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[termtoast] Failed to open config for writing: " << config_path << std::endl;
            return false;
        }

        file << json.dump(4);
        std::cout << "[termtoast] Saved config to: " << config_path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[termtoast] Error saving config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace termtoast
