#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for Prism
 */

#include <cstddef>

namespace prism {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Projection Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Maximum columns in a projection list
constexpr size_t kMaxProjectionColumns = 256;

/// Terminator appended after every field of a DISTINCT key
constexpr char kDistinctKeySeparator = '|';

/// Initial bucket reservation for the DISTINCT key set
constexpr size_t kDefaultDistinctReserve = 64;

// ─────────────────────────────────────────────────────────────────────────────
// Storage Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// VARCHAR length limit for columns declared without one
constexpr size_t kMaxVarcharLength = 4096;

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

/// Name the process-wide spdlog logger is registered under
constexpr const char* kLoggerName = "prism";

/// Environment variable that overrides the logger level
constexpr const char* kLogLevelEnv = "PRISM_LOG_LEVEL";

}  // namespace config
}  // namespace prism
