/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace DelveEngine {

/**
 * @brief Category-organised settings with JSON persistence and typed defaults
 *
 * Owned by whoever runs the simulation; there is no global instance.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/settings.json");
 *   int seed = settings.get<int>("simulation", "seed", 1);
 *   settings.set("simulation", "floor", std::string("entrance"));
 *   settings.saveToFile("res/settings.json");
 */
class SettingsManager {
public:
    SettingsManager() = default;

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, double, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging over current values
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Saves current settings to a JSON file
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     * @tparam T int, double, bool or std::string
     * @return The setting value, or defaultValue if missing or of another type
     *
     * An int setting read as double is widened.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    /**
     * @brief Removes a setting
     * @return true if setting was removed, false if it didn't exist
     */
    bool remove(const std::string& category, const std::string& key);

    bool clearCategory(const std::string& category);
    void clearAll() { m_settings.clear(); }

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    const SettingValue* find(const std::string& category, const std::string& key) const;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (!value) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, double>) {
        if (const int* asInt = std::get_if<int>(value)) {
            return static_cast<double>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, double> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(value)) {
            return *typed;
        }
    }
    // Type mismatch or unsupported type
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, double> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace DelveEngine

#endif // SETTINGS_MANAGER_HPP
