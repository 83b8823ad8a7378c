/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameSettings.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <string>

namespace CloudDefenders {

namespace {

template <typename T>
T readPositive(const SettingsManager& settings, const char* category, const char* key, T fallback) {
    const T value = settings.get<T>(category, key, fallback);
    if (value <= T{0}) {
        SETTINGS_WARNING(std::string(category) + "." + key + " must be positive, using default " +
                         std::to_string(fallback));
        return fallback;
    }
    return value;
}

} // namespace

GameSettings GameSettings::fromSettings(const SettingsManager& settings) {
    GameSettings defaults;
    GameSettings result;

    result.tickRate = readPositive(settings, "simulation", "tick_rate", defaults.tickRate);
    result.maxAccumulatorTicks =
        readPositive(settings, "simulation", "max_accumulator_ticks", defaults.maxAccumulatorTicks);

    const int seed = settings.get<int>("simulation", "random_seed", 0);
    result.randomSeed = seed > 0 ? static_cast<uint32_t>(seed) : 0u;

    result.playfieldWidth = readPositive(settings, "playfield", "width", defaults.playfieldWidth);
    result.playfieldHeight = readPositive(settings, "playfield", "height", defaults.playfieldHeight);
    result.maxWaves = readPositive(settings, "waves", "max_waves", defaults.maxWaves);

    result.timeBetweenWaves = settings.get<float>("waves", "time_between_waves", defaults.timeBetweenWaves);
    if (result.timeBetweenWaves < 0.0f) {
        SETTINGS_WARNING("waves.time_between_waves must not be negative, using default");
        result.timeBetweenWaves = defaults.timeBetweenWaves;
    }

    result.maxLives = readPositive(settings, "game", "max_lives", defaults.maxLives);
    result.cellSize = readPositive(settings, "collision", "cell_size", defaults.cellSize);
    return result;
}

void GameSettings::store(SettingsManager& settings) const {
    settings.set("simulation", "tick_rate", tickRate);
    settings.set("simulation", "max_accumulator_ticks", maxAccumulatorTicks);
    settings.set("simulation", "random_seed", static_cast<int>(randomSeed));
    settings.set("playfield", "width", playfieldWidth);
    settings.set("playfield", "height", playfieldHeight);
    settings.set("waves", "max_waves", maxWaves);
    settings.set("waves", "time_between_waves", timeBetweenWaves);
    settings.set("game", "max_lives", maxLives);
    settings.set("collision", "cell_size", cellSize);
}

} // namespace CloudDefenders
