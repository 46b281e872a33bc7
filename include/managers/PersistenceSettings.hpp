/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PERSISTENCE_SETTINGS_HPP
#define PERSISTENCE_SETTINGS_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Strata {

/**
 * @brief Thread-safe category/key settings for region persistence
 *
 * Values come from a JSON file read with JsonReader; anything the file does
 * not set keeps its built-in default (see restoreDefaults()).
 *
 * Usage:
 *   auto& settings = PersistenceSettings::Instance();
 *   settings.loadFromFile("res/persistence.json");
 *   float reference = settings.get<float>("decay", "rainfall_reference", 4000.0f);
 */
class PersistenceSettings {
public:
    ~PersistenceSettings() = default;

    static PersistenceSettings& Instance() {
        static PersistenceSettings instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file over the current values
     * @param filepath Path to the JSON settings file
     * @return true if the file was read and parsed
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Writes every current setting to a JSON file
     * @param filepath Destination path
     * @return true if the file was written
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     *
     * An int stored under a key read as float is widened; any other type
     * mismatch returns @p defaultValue.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    // Drops every value and installs the built-in defaults
    void restoreDefaults();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent readers or a single writer
    mutable std::shared_mutex m_settingsMutex;

    void installDefaultsLocked();

    PersistenceSettings(const PersistenceSettings&) = delete;
    PersistenceSettings& operator=(const PersistenceSettings&) = delete;

    PersistenceSettings();
};

template<typename T>
T PersistenceSettings::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool PersistenceSettings::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace Strata

#endif // PERSISTENCE_SETTINGS_HPP
