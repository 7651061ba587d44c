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
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace TerraNav {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Release builds write these to the log file
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("TerraNav - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define TERRANAV_CRITICAL(system, msg)                                         \
  TerraNav::Logger::Log(TerraNav::LogLevel::CRITICAL, system, msg)
#define TERRANAV_ERROR(system, msg)                                            \
  TerraNav::Logger::Log(TerraNav::LogLevel::ERROR_LEVEL, system, msg)
#define TERRANAV_WARN(system, msg)                                             \
  TerraNav::Logger::Log(TerraNav::LogLevel::WARNING, system, msg)
#define TERRANAV_INFO(system, msg)                                             \
  TerraNav::Logger::Log(TerraNav::LogLevel::INFO, system, msg)
#define TERRANAV_DEBUG(system, msg)                                            \
  TerraNav::Logger::Log(TerraNav::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - critical and error messages go to a log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TERRANAV_CRITICAL(system, msg)                                         \
  TerraNav::Logger::Log("CRITICAL", system, msg)

#define TERRANAV_ERROR(system, msg)                                            \
  TerraNav::Logger::Log("ERROR", system, msg)

#define TERRANAV_WARN(system, msg) ((void)0)  // Zero overhead
#define TERRANAV_INFO(system, msg) ((void)0)  // Zero overhead
#define TERRANAV_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each navigation system

// World
#define GRID_CRITICAL(msg) TERRANAV_CRITICAL("Grid", msg)
#define GRID_ERROR(msg) TERRANAV_ERROR("Grid", msg)
#define GRID_WARN(msg) TERRANAV_WARN("Grid", msg)
#define GRID_INFO(msg) TERRANAV_INFO("Grid", msg)
#define GRID_DEBUG(msg) TERRANAV_DEBUG("Grid", msg)

// Movement and Navigation
#define MOVEMENT_CRITICAL(msg) TERRANAV_CRITICAL("MovementSystem", msg)
#define MOVEMENT_ERROR(msg) TERRANAV_ERROR("MovementSystem", msg)
#define MOVEMENT_WARN(msg) TERRANAV_WARN("MovementSystem", msg)
#define MOVEMENT_INFO(msg) TERRANAV_INFO("MovementSystem", msg)
#define MOVEMENT_DEBUG(msg) TERRANAV_DEBUG("MovementSystem", msg)

#define NAVGRID_CRITICAL(msg) TERRANAV_CRITICAL("NavigationGrid", msg)
#define NAVGRID_ERROR(msg) TERRANAV_ERROR("NavigationGrid", msg)
#define NAVGRID_WARN(msg) TERRANAV_WARN("NavigationGrid", msg)
#define NAVGRID_INFO(msg) TERRANAV_INFO("NavigationGrid", msg)
#define NAVGRID_DEBUG(msg) TERRANAV_DEBUG("NavigationGrid", msg)

#define PATHFIND_CRITICAL(msg) TERRANAV_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) TERRANAV_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) TERRANAV_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) TERRANAV_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) TERRANAV_DEBUG("Pathfinding", msg)

#define VALIDATION_CRITICAL(msg) TERRANAV_CRITICAL("SpawnValidation", msg)
#define VALIDATION_ERROR(msg) TERRANAV_ERROR("SpawnValidation", msg)
#define VALIDATION_WARN(msg) TERRANAV_WARN("SpawnValidation", msg)
#define VALIDATION_INFO(msg) TERRANAV_INFO("SpawnValidation", msg)
#define VALIDATION_DEBUG(msg) TERRANAV_DEBUG("SpawnValidation", msg)

// Configuration
#define SETTINGS_CRITICAL(msg) TERRANAV_CRITICAL("NavigationSettings", msg)
#define SETTINGS_ERROR(msg) TERRANAV_ERROR("NavigationSettings", msg)
#define SETTINGS_WARNING(msg) TERRANAV_WARN("NavigationSettings", msg)
#define SETTINGS_INFO(msg) TERRANAV_INFO("NavigationSettings", msg)
#define SETTINGS_DEBUG(msg) TERRANAV_DEBUG("NavigationSettings", msg)

// Benchmark mode convenience macros
#define TERRANAV_ENABLE_BENCHMARK_MODE()                                       \
  TerraNav::Logger::SetBenchmarkMode(true)
#define TERRANAV_DISABLE_BENCHMARK_MODE()                                      \
  TerraNav::Logger::SetBenchmarkMode(false)

} // namespace TerraNav

#endif // LOGGER_HPP
