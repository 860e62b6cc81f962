#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for Prism
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

#include "common/config.hpp"

namespace prism {

/**
 * @brief Process-wide logger shared by all iterators
 *
 * Created lazily on first use. The level given to init() can be
 * overridden at run time through the PRISM_LOG_LEVEL environment
 * variable (trace, debug, info, warn, err, critical, off), which is how
 * the per-tuple trace output of the iterators is switched on.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level used unless PRISM_LOG_LEVEL names another
     */
    static void init(const std::string& name = config::kLoggerName,
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger>& get();

    /**
     * @brief Parse a level name, falling back on `fallback`
     *
     * Null, empty and unknown names yield `fallback`.
     */
    static spdlog::level::level_enum parse_level(const char* name,
                                                 spdlog::level::level_enum fallback);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(prism::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(prism::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(prism::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(prism::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(prism::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(prism::Logger::get(), __VA_ARGS__)

}  // namespace prism
