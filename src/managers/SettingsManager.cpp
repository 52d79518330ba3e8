/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace Formicary {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return mergeDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings document - " + reader.getLastError());
        return false;
    }
    return mergeDocument(reader.getRoot(), "<memory>");
}

bool SettingsManager::mergeDocument(const JsonValue& root, const std::string& origin) {
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + origin);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (categoryObj == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                bool integral = std::floor(number) == number &&
                                number >= std::numeric_limits<int>::min() &&
                                number <= std::numeric_limits<int>::max();
                if (integral) {
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
        }
    }

    SETTINGS_INFO("Loaded settings from " + origin);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    // Sorted output keeps config diffs readable
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());

    file << "{\n";
    for (size_t c = 0; c < categories.size(); ++c) {
        const CategorySettings& entries = m_settings.at(categories[c]);
        std::vector<std::string> keys;
        keys.reserve(entries.size());
        for (const auto& [key, _] : entries) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());

        file << "  \"" << categories[c] << "\": {\n";
        for (size_t k = 0; k < keys.size(); ++k) {
            file << "    \"" << keys[k] << "\": ";
            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << "\"" << arg << "\"";
                } else if constexpr (std::is_same_v<T, float>) {
                    // Keep a decimal point on whole floats for readers of the file
                    if (std::floor(arg) == arg && std::abs(arg) < 1e6f) {
                        file << arg << ".0";
                    } else {
                        file << arg;
                    }
                } else {
                    file << arg;
                }
            }, entries.at(keys[k]));
            file << (k + 1 < keys.size() ? ",\n" : "\n");
        }
        file << "  }" << (c + 1 < categories.size() ? ",\n" : "\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Write failed for settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
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

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

} // namespace Formicary
