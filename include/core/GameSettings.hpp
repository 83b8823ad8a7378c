/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_SETTINGS_HPP
#define GAME_SETTINGS_HPP

#include <cstdint>

namespace CloudDefenders {

class SettingsManager;

/**
 * @brief Tunables of one session, resolved from the settings store.
 *
 * Defaults reproduce the reference balance. Out-of-range values read from
 * the store are replaced by the default and logged.
 */
struct GameSettings {
    float tickRate{1.0f / 60.0f};
    int maxAccumulatorTicks{5};
    uint32_t randomSeed{0};  // 0 = non-deterministic seed
    float playfieldWidth{800.0f};
    float playfieldHeight{600.0f};
    int maxWaves{15};
    float timeBetweenWaves{3.0f};
    int maxLives{3};
    float cellSize{64.0f};

    static GameSettings fromSettings(const SettingsManager& settings);

    // Writes every field back, e.g. to seed a fresh settings file
    void store(SettingsManager& settings) const;
};

} // namespace CloudDefenders

#endif // GAME_SETTINGS_HPP
