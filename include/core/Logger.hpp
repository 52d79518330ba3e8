/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t level type
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialized console output
#include <string> // IWYU pragma: keep - std::string() conversions in macros

namespace Formicary {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs, file-backed in release builds
  ERROR_LEVEL = 1, // File-backed in release builds
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

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
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Formicary - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
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

#define FORMICARY_CRITICAL(system, msg)                                        \
  Formicary::Logger::Log(Formicary::LogLevel::CRITICAL, system, msg)
#define FORMICARY_ERROR(system, msg)                                           \
  Formicary::Logger::Log(Formicary::LogLevel::ERROR_LEVEL, system, msg)
#define FORMICARY_WARN(system, msg)                                            \
  Formicary::Logger::Log(Formicary::LogLevel::WARNING, system, msg)
#define FORMICARY_INFO(system, msg)                                            \
  Formicary::Logger::Log(Formicary::LogLevel::INFO, system, msg)
#define FORMICARY_DEBUG(system, msg)                                           \
  Formicary::Logger::Log(Formicary::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: errors go to a rotating log file, the rest compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp, writes through the SDL preference path
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define FORMICARY_CRITICAL(system, msg)                                        \
  Formicary::Logger::Log("CRITICAL", system, msg)
#define FORMICARY_ERROR(system, msg)                                           \
  Formicary::Logger::Log("ERROR", system, msg)
#define FORMICARY_WARN(system, msg) ((void)0)
#define FORMICARY_INFO(system, msg) ((void)0)
#define FORMICARY_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core
#define SIM_CRITICAL(msg) FORMICARY_CRITICAL("ColonySimulation", msg)
#define SIM_ERROR(msg) FORMICARY_ERROR("ColonySimulation", msg)
#define SIM_WARN(msg) FORMICARY_WARN("ColonySimulation", msg)
#define SIM_INFO(msg) FORMICARY_INFO("ColonySimulation", msg)
#define SIM_DEBUG(msg) FORMICARY_DEBUG("ColonySimulation", msg)

#define SIMLOOP_CRITICAL(msg) FORMICARY_CRITICAL("SimLoop", msg)
#define SIMLOOP_ERROR(msg) FORMICARY_ERROR("SimLoop", msg)
#define SIMLOOP_WARN(msg) FORMICARY_WARN("SimLoop", msg)
#define SIMLOOP_INFO(msg) FORMICARY_INFO("SimLoop", msg)
#define SIMLOOP_DEBUG(msg) FORMICARY_DEBUG("SimLoop", msg)

#define SETTINGS_CRITICAL(msg) FORMICARY_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) FORMICARY_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) FORMICARY_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) FORMICARY_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) FORMICARY_DEBUG("SettingsManager", msg)

// Fields
#define SPATIAL_ERROR(msg) FORMICARY_ERROR("SpatialGrid", msg)
#define SPATIAL_WARN(msg) FORMICARY_WARN("SpatialGrid", msg)
#define SPATIAL_DEBUG(msg) FORMICARY_DEBUG("SpatialGrid", msg)

#define PHEROMONE_ERROR(msg) FORMICARY_ERROR("PheromoneField", msg)
#define PHEROMONE_WARN(msg) FORMICARY_WARN("PheromoneField", msg)
#define PHEROMONE_INFO(msg) FORMICARY_INFO("PheromoneField", msg)
#define PHEROMONE_DEBUG(msg) FORMICARY_DEBUG("PheromoneField", msg)

#define WATER_ERROR(msg) FORMICARY_ERROR("WaterGrid", msg)
#define WATER_WARN(msg) FORMICARY_WARN("WaterGrid", msg)
#define WATER_INFO(msg) FORMICARY_INFO("WaterGrid", msg)
#define WATER_DEBUG(msg) FORMICARY_DEBUG("WaterGrid", msg)

// Entities and colonies
#define AGENT_ERROR(msg) FORMICARY_ERROR("AgentDataManager", msg)
#define AGENT_WARN(msg) FORMICARY_WARN("AgentDataManager", msg)
#define AGENT_INFO(msg) FORMICARY_INFO("AgentDataManager", msg)
#define AGENT_DEBUG(msg) FORMICARY_DEBUG("AgentDataManager", msg)

#define COLONY_ERROR(msg) FORMICARY_ERROR("ColonyRegistry", msg)
#define COLONY_WARN(msg) FORMICARY_WARN("ColonyRegistry", msg)
#define COLONY_INFO(msg) FORMICARY_INFO("ColonyRegistry", msg)
#define COLONY_DEBUG(msg) FORMICARY_DEBUG("ColonyRegistry", msg)

#define POPULATE_ERROR(msg) FORMICARY_ERROR("WorldPopulator", msg)
#define POPULATE_WARN(msg) FORMICARY_WARN("WorldPopulator", msg)
#define POPULATE_INFO(msg) FORMICARY_INFO("WorldPopulator", msg)

// Controllers
#define MOVEMENT_DEBUG(msg) FORMICARY_DEBUG("MovementController", msg)

#define DIG_INFO(msg) FORMICARY_INFO("DigController", msg)
#define DIG_DEBUG(msg) FORMICARY_DEBUG("DigController", msg)

#define COMBAT_INFO(msg) FORMICARY_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) FORMICARY_DEBUG("CombatController", msg)

#define FORAGE_INFO(msg) FORMICARY_INFO("ForagingController", msg)
#define FORAGE_DEBUG(msg) FORMICARY_DEBUG("ForagingController", msg)

#define LIFECYCLE_INFO(msg) FORMICARY_INFO("LifecycleController", msg)
#define LIFECYCLE_DEBUG(msg) FORMICARY_DEBUG("LifecycleController", msg)

#define APHID_INFO(msg) FORMICARY_INFO("AphidController", msg)
#define APHID_DEBUG(msg) FORMICARY_DEBUG("AphidController", msg)

#define HAZARD_INFO(msg) FORMICARY_INFO("HazardController", msg)
#define HAZARD_DEBUG(msg) FORMICARY_DEBUG("HazardController", msg)

#define FLOOD_INFO(msg) FORMICARY_INFO("FloodController", msg)
#define FLOOD_DEBUG(msg) FORMICARY_DEBUG("FloodController", msg)

#define FORMICARY_ENABLE_BENCHMARK_MODE()                                      \
  Formicary::Logger::SetBenchmarkMode(true)
#define FORMICARY_DISABLE_BENCHMARK_MODE()                                     \
  Formicary::Logger::SetBenchmarkMode(false)

} // namespace Formicary

#endif // LOGGER_HPP
