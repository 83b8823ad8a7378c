/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <fstream>
#include <limits>

namespace CloudDefenders {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return applyJson(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json, const std::string& sourceName) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings from " + sourceName + " - " + reader.getLastError());
        return false;
    }
    return applyJson(reader.getRoot(), sourceName);
}

bool SettingsManager::applyJson(const JsonValue& root, const std::string& sourceName) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + sourceName);
        return false;
    }

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
                const bool integral = std::floor(number) == number &&
                                      std::abs(number) <= std::numeric_limits<int>::max();
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

            m_settings[categoryName][key] = settingValue;
            m_changeListeners.notify(categoryName, key, settingValue);
        }
    }

    SETTINGS_INFO("Loaded settings from " + sourceName);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonValue& category = root[categoryName];
        category = JsonValue(JsonObject{});
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit([](const auto& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, float>) {
                    return JsonValue(static_cast<double>(arg));
                } else {
                    return JsonValue(arg);
                }
            }, value);
        }
    }
    if (!root.isObject()) {
        root = JsonValue(JsonObject{});
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << root.toString(2) << "\n";
    if (!file.good()) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category,
                                                           const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt != categoryIt->second.end() ? &keyIt->second : nullptr;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return find(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    if (!callback) {
        return 0;
    }
    if (category.empty()) {
        return m_changeListeners.add(std::move(callback));
    }
    return m_changeListeners.add(
        [category, callback = std::move(callback)](const std::string& changed, const std::string& key,
                                                   const SettingValue& value) {
            if (changed == category) {
                callback(changed, key, value);
            }
        });
}

bool SettingsManager::unregisterChangeListener(size_t callbackId) {
    return m_changeListeners.remove(callbackId);
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
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

} // namespace CloudDefenders
