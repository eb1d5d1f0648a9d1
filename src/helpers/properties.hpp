#pragma once

#include <charconv>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "debug.hpp"
#include "string_helper.hpp"

namespace mailbridge::helpers {

/**
 * Reader for "key = value" properties files.
 *
 * Blank lines and lines starting with '#' are ignored, malformed lines are
 * reported and skipped. Values are kept as text; the typed getters convert on
 * access and fall back to the supplied default when conversion fails.
 */
class properties {
public:
    properties() = default;

    // Returns false when the file does not exist or cannot be read
    bool load(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            CONFIG_WARN_FMT("Config file {} not found, using defaults", path.string());
            return false;
        }
        parse(file);
        CONFIG_INFO_FMT("Loaded configuration from {}", path.string());
        return true;
    }

    void parse(std::istream& in) {
        std::string line;
        for (int line_num = 1; std::getline(in, line); ++line_num) {
            auto view = StringHelper::trim(line);
            if (view.empty() || view.front() == '#') {
                continue;
            }
            auto eq = view.find('=');
            if (eq == std::string_view::npos) {
                CONFIG_WARN_FMT("Invalid line {} in config file: {}", line_num, view);
                continue;
            }
            auto key = StringHelper::trim(view.substr(0, eq));
            if (key.empty()) {
                CONFIG_WARN_FMT("Missing key on line {} in config file", line_num);
                continue;
            }
            values_[std::string{key}] = std::string{StringHelper::trim(view.substr(eq + 1))};
        }
    }

    bool contains(std::string_view key) const {
        return values_.find(key) != values_.end();
    }

    std::optional<std::string> get(std::string_view key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string get_string(std::string_view key, std::string_view fallback = {}) const {
        auto value = get(key);
        return value ? *value : std::string{fallback};
    }

    long long get_int(std::string_view key, long long fallback) const {
        auto value = get(key);
        if (!value || value->empty()) {
            return fallback;
        }
        long long result{};
        auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
        if (ec != std::errc{} || ptr != value->data() + value->size()) {
            CONFIG_WARN_FMT("Invalid integer '{}' for {}, using {}", *value, key, fallback);
            return fallback;
        }
        return result;
    }

    bool get_bool(std::string_view key, bool fallback) const {
        auto value = get(key);
        if (!value) {
            return fallback;
        }
        auto lowered = StringHelper::to_lower(*value);
        if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
            return false;
        }
        CONFIG_WARN_FMT("Invalid boolean '{}' for {}, using {}", *value, key, fallback);
        return fallback;
    }

private:
    std::map<std::string, std::string, std::less<>> values_;
};

} // namespace mailbridge::helpers
