/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include "utils/CallbackList.hpp"
#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace CloudDefenders {

class JsonValue;

/**
 * @brief Category/key settings store with JSON persistence
 *
 * Values are kept as int, float, bool or string. Numeric reads are lenient:
 * get<float> on an int setting (and the reverse) converts instead of
 * falling back to the default, so "tick_rate": 1 and 1.0 read the same.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   float width = settings.get<float>("playfield", "width", 800.0f);
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
     * @brief Callback function type for change notifications
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges settings from a JSON file into the store
     * @return false (and logs) if the file is missing or malformed; the
     *         store is left untouched in that case
     */
    bool loadFromFile(const std::string& filepath);

    // Same as loadFromFile, reading from a string
    bool loadFromString(const std::string& json, const std::string& sourceName = "<memory>");

    /**
     * @brief Writes every setting to a JSON file, categories and keys sorted
     */
    bool saveToFile(const std::string& filepath) const;

    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @return Id for unregisterChangeListener, 0 if callback is empty
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    bool unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;

    CallbackList<const std::string&, const std::string&, const SettingValue&> m_changeListeners;

    bool applyJson(const JsonValue& root, const std::string& sourceName);
    const SettingValue* find(const std::string& category, const std::string& key) const;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (!value) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float>) {
        if (const int* i = std::get_if<int>(value)) {
            return static_cast<T>(*i);
        }
        if (const float* f = std::get_if<float>(value)) {
            return static_cast<T>(*f);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool>) {
        const bool* b = std::get_if<bool>(value);
        return b ? *b : defaultValue;
    } else if constexpr (std::is_same_v<T, std::string>) {
        const std::string* s = std::get_if<std::string>(value);
        return s ? *s : defaultValue;
    } else {
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, double>) {
        settingValue = static_cast<float>(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    m_settings[category][key] = settingValue;
    m_changeListeners.notify(category, key, settingValue);
    return true;
}

} // namespace CloudDefenders

#endif // SETTINGS_MANAGER_HPP
