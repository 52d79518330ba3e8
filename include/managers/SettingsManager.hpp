/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Formicary {

class JsonValue;

/**
 * @brief Categorised simulation settings with JSON persistence
 *
 * Holds the raw "category.key" values read from a config file. The
 * simulation never reads this at tick time; SimConfig::fromSettings()
 * copies everything into a snapshot at startup.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/sim_config.json");
 *   int width = settings.get<int>("world", "width", 200);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file into the current set
     * @return false if the file is missing or malformed; nothing is merged then
     */
    bool loadFromFile(const std::string& filepath);

    /// Same as loadFromFile() for an in-memory document
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup with default
     *
     * An int setting read as float is widened, so "1" in a file satisfies a
     * float field. Any other type mismatch yields the default.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;

    bool mergeDocument(const JsonValue& root, const std::string& origin);

    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
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
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
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

} // namespace Formicary

#endif // SETTINGS_MANAGER_HPP
