/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdint: Required for uint8_t/uint32_t types
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstddef> // IWYU pragma: keep - Required for size_t
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace DelveEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

constexpr size_t LOG_LEVEL_COUNT{5};

/**
 * Engine logger shared by every system through the per-system macros below.
 *
 * Debug builds echo every level to stdout. Release builds compile WARNING,
 * INFO and DEBUG away and send CRITICAL/ERROR to stderr unless a log file
 * is open. When a log file is open (SetLogFile, driven by the "logging.file"
 * setting or --log) every emitted line is also appended there with a
 * timestamp.
 *
 * Each emitted message bumps a per-level counter; the driver prints them in
 * its run summary.
 */
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

  static void Log(LogLevel level, const char *system, const char *message);

  /**
   * Open (append) or switch the log file; an empty path closes it.
   * @return false if the file could not be opened; logging then continues
   *         on the console only
   */
  static bool SetLogFile(const std::string &path);
  static std::string GetLogFile();

  // Messages emitted since start or the last ResetCounts(), per level
  static uint32_t GetCount(LogLevel level);
  static void ResetCounts();

  static const char *GetLevelString(LogLevel level);
};

#ifdef DEBUG
// Full logging system in debug builds
#define DELVE_CRITICAL(system, msg)                                            \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::CRITICAL, system, msg)
#define DELVE_ERROR(system, msg)                                               \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::ERROR_LEVEL, system, msg)
#define DELVE_WARN(system, msg)                                                \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::WARNING, system, msg)
#define DELVE_INFO(system, msg)                                                \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::INFO, system, msg)
#define DELVE_DEBUG(system, msg)                                               \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only CRITICAL/ERROR survive
#define DELVE_CRITICAL(system, msg)                                            \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::CRITICAL, system, msg)
#define DELVE_ERROR(system, msg)                                               \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::ERROR_LEVEL, system, msg)

#define DELVE_WARN(system, msg) ((void)0)  // Zero overhead
#define DELVE_INFO(system, msg) ((void)0)  // Zero overhead
#define DELVE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};

// Convenience macros for each system

// Floor generation
#define FLOOR_CRITICAL(msg) DELVE_CRITICAL("FloorState", msg)
#define FLOOR_ERROR(msg) DELVE_ERROR("FloorState", msg)
#define FLOOR_WARN(msg) DELVE_WARN("FloorState", msg)
#define FLOOR_INFO(msg) DELVE_INFO("FloorState", msg)
#define FLOOR_DEBUG(msg) DELVE_DEBUG("FloorState", msg)

#define TERRAIN_CRITICAL(msg) DELVE_CRITICAL("TerrainGrid", msg)
#define TERRAIN_ERROR(msg) DELVE_ERROR("TerrainGrid", msg)
#define TERRAIN_WARN(msg) DELVE_WARN("TerrainGrid", msg)
#define TERRAIN_INFO(msg) DELVE_INFO("TerrainGrid", msg)
#define TERRAIN_DEBUG(msg) DELVE_DEBUG("TerrainGrid", msg)

#define OCCUPANCY_CRITICAL(msg) DELVE_CRITICAL("GridOccupancy", msg)
#define OCCUPANCY_ERROR(msg) DELVE_ERROR("GridOccupancy", msg)
#define OCCUPANCY_WARN(msg) DELVE_WARN("GridOccupancy", msg)
#define OCCUPANCY_INFO(msg) DELVE_INFO("GridOccupancy", msg)
#define OCCUPANCY_DEBUG(msg) DELVE_DEBUG("GridOccupancy", msg)

#define MOVEMENT_CRITICAL(msg) DELVE_CRITICAL("MovementValidator", msg)
#define MOVEMENT_ERROR(msg) DELVE_ERROR("MovementValidator", msg)
#define MOVEMENT_WARN(msg) DELVE_WARN("MovementValidator", msg)
#define MOVEMENT_INFO(msg) DELVE_INFO("MovementValidator", msg)
#define MOVEMENT_DEBUG(msg) DELVE_DEBUG("MovementValidator", msg)

#define SPAWN_CRITICAL(msg) DELVE_CRITICAL("SpawnResolver", msg)
#define SPAWN_ERROR(msg) DELVE_ERROR("SpawnResolver", msg)
#define SPAWN_WARN(msg) DELVE_WARN("SpawnResolver", msg)
#define SPAWN_INFO(msg) DELVE_INFO("SpawnResolver", msg)
#define SPAWN_DEBUG(msg) DELVE_DEBUG("SpawnResolver", msg)

// Combat
#define COMBAT_CRITICAL(msg) DELVE_CRITICAL("CombatEncounter", msg)
#define COMBAT_ERROR(msg) DELVE_ERROR("CombatEncounter", msg)
#define COMBAT_WARN(msg) DELVE_WARN("CombatEncounter", msg)
#define COMBAT_INFO(msg) DELVE_INFO("CombatEncounter", msg)
#define COMBAT_DEBUG(msg) DELVE_DEBUG("CombatEncounter", msg)

#define LOOT_CRITICAL(msg) DELVE_CRITICAL("LootTable", msg)
#define LOOT_ERROR(msg) DELVE_ERROR("LootTable", msg)
#define LOOT_WARN(msg) DELVE_WARN("LootTable", msg)
#define LOOT_INFO(msg) DELVE_INFO("LootTable", msg)
#define LOOT_DEBUG(msg) DELVE_DEBUG("LootTable", msg)

#define REGISTRY_CRITICAL(msg) DELVE_CRITICAL("MobRegistry", msg)
#define REGISTRY_ERROR(msg) DELVE_ERROR("MobRegistry", msg)
#define REGISTRY_WARN(msg) DELVE_WARN("MobRegistry", msg)
#define REGISTRY_INFO(msg) DELVE_INFO("MobRegistry", msg)
#define REGISTRY_DEBUG(msg) DELVE_DEBUG("MobRegistry", msg)

// Data and persistence
#define SETTINGS_CRITICAL(msg) DELVE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) DELVE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) DELVE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) DELVE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) DELVE_DEBUG("SettingsManager", msg)

#define SAVEGAME_CRITICAL(msg) DELVE_CRITICAL("FloorSnapshot", msg)
#define SAVEGAME_ERROR(msg) DELVE_ERROR("FloorSnapshot", msg)
#define SAVEGAME_WARN(msg) DELVE_WARN("FloorSnapshot", msg)
#define SAVEGAME_INFO(msg) DELVE_INFO("FloorSnapshot", msg)
#define SAVEGAME_DEBUG(msg) DELVE_DEBUG("FloorSnapshot", msg)

#define JSON_CRITICAL(msg) DELVE_CRITICAL("JsonReader", msg)
#define JSON_ERROR(msg) DELVE_ERROR("JsonReader", msg)
#define JSON_WARN(msg) DELVE_WARN("JsonReader", msg)
#define JSON_INFO(msg) DELVE_INFO("JsonReader", msg)
#define JSON_DEBUG(msg) DELVE_DEBUG("JsonReader", msg)

// Headless driver
#define SIM_CRITICAL(msg) DELVE_CRITICAL("DelveSim", msg)
#define SIM_ERROR(msg) DELVE_ERROR("DelveSim", msg)
#define SIM_WARN(msg) DELVE_WARN("DelveSim", msg)
#define SIM_INFO(msg) DELVE_INFO("DelveSim", msg)
#define SIM_DEBUG(msg) DELVE_DEBUG("DelveSim", msg)

// Benchmark mode convenience macros
#define DELVE_ENABLE_BENCHMARK_MODE()                                          \
  DelveEngine::Logger::SetBenchmarkMode(true)
#define DELVE_DISABLE_BENCHMARK_MODE()                                         \
  DelveEngine::Logger::SetBenchmarkMode(false)

} // namespace DelveEngine

#endif // LOGGER_HPP
