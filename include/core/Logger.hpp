/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace CloudDefenders {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

// The simulation runs on a single thread, so the logger does not lock.
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    printf("Cloud Defenders - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};

#define CLOUDDEF_CRITICAL(system, msg)                                         \
  CloudDefenders::Logger::Log(CloudDefenders::LogLevel::CRITICAL, system, msg)
#define CLOUDDEF_ERROR(system, msg)                                            \
  CloudDefenders::Logger::Log(CloudDefenders::LogLevel::ERROR_LEVEL, system,  \
                              msg)

#ifdef DEBUG
// Debug build macros - full functionality
#define CLOUDDEF_WARN(system, msg)                                             \
  CloudDefenders::Logger::Log(CloudDefenders::LogLevel::WARNING, system, msg)
#define CLOUDDEF_INFO(system, msg)                                             \
  CloudDefenders::Logger::Log(CloudDefenders::LogLevel::INFO, system, msg)
#define CLOUDDEF_DEBUG(system, msg)                                            \
  CloudDefenders::Logger::Log(CloudDefenders::LogLevel::DEBUG_LEVEL, system,  \
                              msg)
#else
#define CLOUDDEF_WARN(system, msg) ((void)0)  // Zero overhead
#define CLOUDDEF_INFO(system, msg) ((void)0)  // Zero overhead
#define CLOUDDEF_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each manager and core system

// Core Systems
#define GAMELOOP_CRITICAL(msg) CLOUDDEF_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) CLOUDDEF_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) CLOUDDEF_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) CLOUDDEF_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) CLOUDDEF_DEBUG("GameLoop", msg)

#define SESSION_CRITICAL(msg) CLOUDDEF_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) CLOUDDEF_ERROR("GameSession", msg)
#define SESSION_WARN(msg) CLOUDDEF_WARN("GameSession", msg)
#define SESSION_INFO(msg) CLOUDDEF_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) CLOUDDEF_DEBUG("GameSession", msg)

#define PLATFORM_CRITICAL(msg) CLOUDDEF_CRITICAL("Platform", msg)
#define PLATFORM_ERROR(msg) CLOUDDEF_ERROR("Platform", msg)
#define PLATFORM_WARN(msg) CLOUDDEF_WARN("Platform", msg)
#define PLATFORM_INFO(msg) CLOUDDEF_INFO("Platform", msg)
#define PLATFORM_DEBUG(msg) CLOUDDEF_DEBUG("Platform", msg)

// Manager Systems
#define ENTITYMGR_CRITICAL(msg) CLOUDDEF_CRITICAL("EntityManager", msg)
#define ENTITYMGR_ERROR(msg) CLOUDDEF_ERROR("EntityManager", msg)
#define ENTITYMGR_WARN(msg) CLOUDDEF_WARN("EntityManager", msg)
#define ENTITYMGR_INFO(msg) CLOUDDEF_INFO("EntityManager", msg)
#define ENTITYMGR_DEBUG(msg) CLOUDDEF_DEBUG("EntityManager", msg)

#define WAVE_CRITICAL(msg) CLOUDDEF_CRITICAL("WaveManager", msg)
#define WAVE_ERROR(msg) CLOUDDEF_ERROR("WaveManager", msg)
#define WAVE_WARN(msg) CLOUDDEF_WARN("WaveManager", msg)
#define WAVE_INFO(msg) CLOUDDEF_INFO("WaveManager", msg)
#define WAVE_DEBUG(msg) CLOUDDEF_DEBUG("WaveManager", msg)

#define CONDITIONS_CRITICAL(msg) CLOUDDEF_CRITICAL("GameConditions", msg)
#define CONDITIONS_ERROR(msg) CLOUDDEF_ERROR("GameConditions", msg)
#define CONDITIONS_WARN(msg) CLOUDDEF_WARN("GameConditions", msg)
#define CONDITIONS_INFO(msg) CLOUDDEF_INFO("GameConditions", msg)
#define CONDITIONS_DEBUG(msg) CLOUDDEF_DEBUG("GameConditions", msg)

#define SETTINGS_CRITICAL(msg) CLOUDDEF_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) CLOUDDEF_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) CLOUDDEF_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) CLOUDDEF_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) CLOUDDEF_DEBUG("SettingsManager", msg)

// Collision Systems
#define COLLISION_CRITICAL(msg) CLOUDDEF_CRITICAL("SpatialGrid", msg)
#define COLLISION_ERROR(msg) CLOUDDEF_ERROR("SpatialGrid", msg)
#define COLLISION_WARN(msg) CLOUDDEF_WARN("SpatialGrid", msg)
#define COLLISION_INFO(msg) CLOUDDEF_INFO("SpatialGrid", msg)
#define COLLISION_DEBUG(msg) CLOUDDEF_DEBUG("SpatialGrid", msg)

// Entity Systems
#define ENTITY_CRITICAL(msg) CLOUDDEF_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) CLOUDDEF_ERROR("Entity", msg)
#define ENTITY_WARN(msg) CLOUDDEF_WARN("Entity", msg)
#define ENTITY_INFO(msg) CLOUDDEF_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) CLOUDDEF_DEBUG("Entity", msg)

#define MISSILE_CRITICAL(msg) CLOUDDEF_CRITICAL("Missile", msg)
#define MISSILE_ERROR(msg) CLOUDDEF_ERROR("Missile", msg)
#define MISSILE_WARN(msg) CLOUDDEF_WARN("Missile", msg)
#define MISSILE_INFO(msg) CLOUDDEF_INFO("Missile", msg)
#define MISSILE_DEBUG(msg) CLOUDDEF_DEBUG("Missile", msg)

#define DEFENSE_CRITICAL(msg) CLOUDDEF_CRITICAL("Defense", msg)
#define DEFENSE_ERROR(msg) CLOUDDEF_ERROR("Defense", msg)
#define DEFENSE_WARN(msg) CLOUDDEF_WARN("Defense", msg)
#define DEFENSE_INFO(msg) CLOUDDEF_INFO("Defense", msg)
#define DEFENSE_DEBUG(msg) CLOUDDEF_DEBUG("Defense", msg)

#define TARGET_CRITICAL(msg) CLOUDDEF_CRITICAL("Target", msg)
#define TARGET_ERROR(msg) CLOUDDEF_ERROR("Target", msg)
#define TARGET_WARN(msg) CLOUDDEF_WARN("Target", msg)
#define TARGET_INFO(msg) CLOUDDEF_INFO("Target", msg)
#define TARGET_DEBUG(msg) CLOUDDEF_DEBUG("Target", msg)

// Benchmark mode convenience macros
#define CLOUDDEF_ENABLE_BENCHMARK_MODE()                                       \
  CloudDefenders::Logger::SetBenchmarkMode(true)
#define CLOUDDEF_DISABLE_BENCHMARK_MODE()                                      \
  CloudDefenders::Logger::SetBenchmarkMode(false)

} // namespace CloudDefenders

#endif // LOGGER_HPP
