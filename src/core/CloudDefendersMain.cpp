/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/GameSettings.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <string>

const std::string GAME_NAME{"Cloud Defenders"};
const std::string SETTINGS_PATH{"res/settings.json"};

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  PLATFORM_INFO("Initializing " + GAME_NAME);

  auto& settingsManager = CloudDefenders::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(SETTINGS_PATH)) {
    PLATFORM_WARN("Failed to load " + SETTINGS_PATH + " - using defaults");
  }

  const CloudDefenders::GameSettings settings =
      CloudDefenders::GameSettings::fromSettings(settingsManager);
  const bool fullscreen = settingsManager.get<bool>("graphics", "fullscreen", false);

  GameEngine engine;
  if (!engine.init(GAME_NAME, settings, fullscreen)) {
    PLATFORM_CRITICAL("Init " + GAME_NAME + " failed");
    engine.clean();
    return -1;
  }

  PLATFORM_INFO("Starting Main Loop");
  engine.run();
  engine.clean();
  return 0;
}
