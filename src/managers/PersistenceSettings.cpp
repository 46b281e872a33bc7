/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/PersistenceSettings.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <fstream>

namespace Strata {

namespace {

std::string escapeJson(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

} // namespace

PersistenceSettings::PersistenceSettings() {
    installDefaultsLocked();
}

void PersistenceSettings::installDefaultsLocked() {
    // Empty root means "use the platform preference path"
    m_settings["storage"]["root"] = std::string();
    m_settings["storage"]["persistent_id"] = std::string();
    m_settings["eligibility"]["excluded_defs"] = std::string("void_monolith");
    m_settings["decay"]["enabled"] = true;
    m_settings["decay"]["rainfall_reference"] = 4000.0f;
    m_settings["decay"]["max_failure_events"] = 8;
    m_settings["decay"]["failure_mtb_days"] = 300.0f;
    m_settings["decay"]["seed"] = 0;
    m_settings["restore"]["search_radius"] = 8;
}

bool PersistenceSettings::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    size_t loaded = 0;
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (number == static_cast<double>(static_cast<int>(number))) {
                    settingValue = static_cast<int>(number);
                } else {
                    settingValue = static_cast<float>(number);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            m_settings[categoryName][key] = std::move(settingValue);
            ++loaded;
        }
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded) + " settings from file: " + filepath);
    return true;
}

bool PersistenceSettings::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    // Sorted output keeps the file stable between saves
    std::vector<std::string> categories;
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());

    file << "{\n";
    for (size_t c = 0; c < categories.size(); ++c) {
        const CategorySettings& values = m_settings.at(categories[c]);
        std::vector<std::string> keys;
        for (const auto& [key, _] : values) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());

        file << "  \"" << escapeJson(categories[c]) << "\": {\n";
        for (size_t k = 0; k < keys.size(); ++k) {
            file << "    \"" << escapeJson(keys[k]) << "\": ";
            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << "\"" << escapeJson(arg) << "\"";
                } else {
                    file << arg;
                }
            }, values.at(keys[k]));
            file << (k + 1 < keys.size() ? ",\n" : "\n");
        }
        file << "  }" << (c + 1 < categories.size() ? ",\n" : "\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }
    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool PersistenceSettings::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) != 0;
}

bool PersistenceSettings::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void PersistenceSettings::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

void PersistenceSettings::restoreDefaults() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
    installDefaultsLocked();
}

std::vector<std::string> PersistenceSettings::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> PersistenceSettings::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }
    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace Strata
