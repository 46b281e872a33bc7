/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for serialized output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Strata {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging in debug builds
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
    printf("Strata - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define STRATA_CRITICAL(system, msg)                                           \
  Strata::Logger::Log(Strata::LogLevel::CRITICAL, system, msg)
#define STRATA_ERROR(system, msg)                                              \
  Strata::Logger::Log(Strata::LogLevel::ERROR_LEVEL, system, msg)
#define STRATA_WARN(system, msg)                                               \
  Strata::Logger::Log(Strata::LogLevel::WARNING, system, msg)
#define STRATA_INFO(system, msg)                                               \
  Strata::Logger::Log(Strata::LogLevel::INFO, system, msg)
#define STRATA_DEBUG(system, msg)                                              \
  Strata::Logger::Log(Strata::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep only CRITICAL and ERROR
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
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Strata - [%s] %s: %s\n", system, level, message);
    fflush(stdout);
  }
};

#define STRATA_CRITICAL(system, msg)                                           \
  Strata::Logger::Log("CRITICAL", system, msg)

#define STRATA_ERROR(system, msg) Strata::Logger::Log("ERROR", system, msg)

#define STRATA_WARN(system, msg) ((void)0)  // Zero overhead
#define STRATA_INFO(system, msg) ((void)0)  // Zero overhead
#define STRATA_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros per subsystem

// Archive sessions and the region orchestrator
#define ARCHIVE_CRITICAL(msg) STRATA_CRITICAL("RegionArchive", msg)
#define ARCHIVE_ERROR(msg) STRATA_ERROR("RegionArchive", msg)
#define ARCHIVE_WARN(msg) STRATA_WARN("RegionArchive", msg)
#define ARCHIVE_INFO(msg) STRATA_INFO("RegionArchive", msg)
#define ARCHIVE_DEBUG(msg) STRATA_DEBUG("RegionArchive", msg)

#define OWNERSHIP_CRITICAL(msg) STRATA_CRITICAL("OwnershipTransfer", msg)
#define OWNERSHIP_ERROR(msg) STRATA_ERROR("OwnershipTransfer", msg)
#define OWNERSHIP_WARN(msg) STRATA_WARN("OwnershipTransfer", msg)
#define OWNERSHIP_INFO(msg) STRATA_INFO("OwnershipTransfer", msg)
#define OWNERSHIP_DEBUG(msg) STRATA_DEBUG("OwnershipTransfer", msg)

#define DECAY_CRITICAL(msg) STRATA_CRITICAL("DecaySimulation", msg)
#define DECAY_ERROR(msg) STRATA_ERROR("DecaySimulation", msg)
#define DECAY_WARN(msg) STRATA_WARN("DecaySimulation", msg)
#define DECAY_INFO(msg) STRATA_INFO("DecaySimulation", msg)
#define DECAY_DEBUG(msg) STRATA_DEBUG("DecaySimulation", msg)

#define SIDETABLE_CRITICAL(msg) STRATA_CRITICAL("RegionSideTable", msg)
#define SIDETABLE_ERROR(msg) STRATA_ERROR("RegionSideTable", msg)
#define SIDETABLE_WARN(msg) STRATA_WARN("RegionSideTable", msg)
#define SIDETABLE_INFO(msg) STRATA_INFO("RegionSideTable", msg)
#define SIDETABLE_DEBUG(msg) STRATA_DEBUG("RegionSideTable", msg)

#define IDENTITY_CRITICAL(msg) STRATA_CRITICAL("IdentityRegistry", msg)
#define IDENTITY_ERROR(msg) STRATA_ERROR("IdentityRegistry", msg)
#define IDENTITY_WARN(msg) STRATA_WARN("IdentityRegistry", msg)
#define IDENTITY_INFO(msg) STRATA_INFO("IdentityRegistry", msg)
#define IDENTITY_DEBUG(msg) STRATA_DEBUG("IdentityRegistry", msg)

// Host model
#define REGION_CRITICAL(msg) STRATA_CRITICAL("Region", msg)
#define REGION_ERROR(msg) STRATA_ERROR("Region", msg)
#define REGION_WARN(msg) STRATA_WARN("Region", msg)
#define REGION_INFO(msg) STRATA_INFO("Region", msg)
#define REGION_DEBUG(msg) STRATA_DEBUG("Region", msg)

#define WORLD_CRITICAL(msg) STRATA_CRITICAL("World", msg)
#define WORLD_ERROR(msg) STRATA_ERROR("World", msg)
#define WORLD_WARN(msg) STRATA_WARN("World", msg)
#define WORLD_INFO(msg) STRATA_INFO("World", msg)
#define WORLD_DEBUG(msg) STRATA_DEBUG("World", msg)

#define LIFECYCLE_CRITICAL(msg) STRATA_CRITICAL("RegionLifecycle", msg)
#define LIFECYCLE_ERROR(msg) STRATA_ERROR("RegionLifecycle", msg)
#define LIFECYCLE_WARN(msg) STRATA_WARN("RegionLifecycle", msg)
#define LIFECYCLE_INFO(msg) STRATA_INFO("RegionLifecycle", msg)
#define LIFECYCLE_DEBUG(msg) STRATA_DEBUG("RegionLifecycle", msg)

#define GENERATOR_CRITICAL(msg) STRATA_CRITICAL("RegionGenerator", msg)
#define GENERATOR_ERROR(msg) STRATA_ERROR("RegionGenerator", msg)
#define GENERATOR_WARN(msg) STRATA_WARN("RegionGenerator", msg)
#define GENERATOR_INFO(msg) STRATA_INFO("RegionGenerator", msg)
#define GENERATOR_DEBUG(msg) STRATA_DEBUG("RegionGenerator", msg)

// Configuration and storage
#define SETTINGS_CRITICAL(msg) STRATA_CRITICAL("PersistenceSettings", msg)
#define SETTINGS_ERROR(msg) STRATA_ERROR("PersistenceSettings", msg)
#define SETTINGS_WARNING(msg) STRATA_WARN("PersistenceSettings", msg)
#define SETTINGS_INFO(msg) STRATA_INFO("PersistenceSettings", msg)
#define SETTINGS_DEBUG(msg) STRATA_DEBUG("PersistenceSettings", msg)

#define STORAGE_CRITICAL(msg) STRATA_CRITICAL("ArchiveStorage", msg)
#define STORAGE_ERROR(msg) STRATA_ERROR("ArchiveStorage", msg)
#define STORAGE_WARN(msg) STRATA_WARN("ArchiveStorage", msg)
#define STORAGE_INFO(msg) STRATA_INFO("ArchiveStorage", msg)
#define STORAGE_DEBUG(msg) STRATA_DEBUG("ArchiveStorage", msg)

// Benchmark mode convenience macros
#define STRATA_ENABLE_BENCHMARK_MODE() Strata::Logger::SetBenchmarkMode(true)
#define STRATA_DISABLE_BENCHMARK_MODE() Strata::Logger::SetBenchmarkMode(false)

} // namespace Strata

#endif // LOGGER_HPP
