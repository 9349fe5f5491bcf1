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

namespace TileNav {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
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
    printf("TileNav - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define TILENAV_CRITICAL(system, msg)                                          \
  TileNav::Logger::Log(TileNav::LogLevel::CRITICAL, system, msg)
#define TILENAV_ERROR(system, msg)                                             \
  TileNav::Logger::Log(TileNav::LogLevel::ERROR_LEVEL, system, msg)
#define TILENAV_WARN(system, msg)                                              \
  TileNav::Logger::Log(TileNav::LogLevel::WARNING, system, msg)
#define TILENAV_INFO(system, msg)                                              \
  TileNav::Logger::Log(TileNav::LogLevel::INFO, system, msg)
#define TILENAV_DEBUG(system, msg)                                             \
  TileNav::Logger::Log(TileNav::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: CRITICAL and ERROR go to a log file (see Logger.cpp),
// everything else compiles away
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

#define TILENAV_CRITICAL(system, msg)                                          \
  TileNav::Logger::Log("CRITICAL", system, msg)

#define TILENAV_ERROR(system, msg) TileNav::Logger::Log("ERROR", system, msg)

#define TILENAV_WARN(system, msg) ((void)0)  // Zero overhead
#define TILENAV_INFO(system, msg) ((void)0)  // Zero overhead
#define TILENAV_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Subsystem convenience macros

#define PATHFIND_CRITICAL(msg) TILENAV_CRITICAL("Pathfinder", msg)
#define PATHFIND_ERROR(msg) TILENAV_ERROR("Pathfinder", msg)
#define PATHFIND_WARN(msg) TILENAV_WARN("Pathfinder", msg)
#define PATHFIND_INFO(msg) TILENAV_INFO("Pathfinder", msg)
#define PATHFIND_DEBUG(msg) TILENAV_DEBUG("Pathfinder", msg)

#define ESCAPE_CRITICAL(msg) TILENAV_CRITICAL("EscapeRouter", msg)
#define ESCAPE_ERROR(msg) TILENAV_ERROR("EscapeRouter", msg)
#define ESCAPE_WARN(msg) TILENAV_WARN("EscapeRouter", msg)
#define ESCAPE_INFO(msg) TILENAV_INFO("EscapeRouter", msg)
#define ESCAPE_DEBUG(msg) TILENAV_DEBUG("EscapeRouter", msg)

#define TILEMAP_CRITICAL(msg) TILENAV_CRITICAL("TileMap", msg)
#define TILEMAP_ERROR(msg) TILENAV_ERROR("TileMap", msg)
#define TILEMAP_WARN(msg) TILENAV_WARN("TileMap", msg)
#define TILEMAP_INFO(msg) TILENAV_INFO("TileMap", msg)
#define TILEMAP_DEBUG(msg) TILENAV_DEBUG("TileMap", msg)

#define CONFIG_CRITICAL(msg) TILENAV_CRITICAL("PathfindingConfig", msg)
#define CONFIG_ERROR(msg) TILENAV_ERROR("PathfindingConfig", msg)
#define CONFIG_WARN(msg) TILENAV_WARN("PathfindingConfig", msg)
#define CONFIG_INFO(msg) TILENAV_INFO("PathfindingConfig", msg)
#define CONFIG_DEBUG(msg) TILENAV_DEBUG("PathfindingConfig", msg)

#define PURSUIT_CRITICAL(msg) TILENAV_CRITICAL("PursuitController", msg)
#define PURSUIT_ERROR(msg) TILENAV_ERROR("PursuitController", msg)
#define PURSUIT_WARN(msg) TILENAV_WARN("PursuitController", msg)
#define PURSUIT_INFO(msg) TILENAV_INFO("PursuitController", msg)
#define PURSUIT_DEBUG(msg) TILENAV_DEBUG("PursuitController", msg)

// Benchmark mode convenience macros
#define TILENAV_ENABLE_BENCHMARK_MODE() TileNav::Logger::SetBenchmarkMode(true)
#define TILENAV_DISABLE_BENCHMARK_MODE()                                       \
  TileNav::Logger::SetBenchmarkMode(false)

} // namespace TileNav

#endif // LOGGER_HPP
