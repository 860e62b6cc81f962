/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

#include <cstdlib>
#include <string_view>

namespace prism {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    if (logger_ != nullptr) {
        return;
    }
    // Reuse a logger registered under the same name by an earlier init
    logger_ = spdlog::get(name);
    if (logger_ == nullptr) {
        logger_ = spdlog::stdout_color_mt(name);
    }
    logger_->set_level(parse_level(std::getenv(config::kLogLevelEnv), level));
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v");
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (logger_ == nullptr) {
        init();
    }
    return logger_;
}

spdlog::level::level_enum Logger::parse_level(const char* name,
                                              spdlog::level::level_enum fallback) {
    if (name == nullptr || *name == '\0') {
        return fallback;
    }
    // from_str maps unknown names to off; only accept names that round-trip
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && std::string_view(name) != "off") {
        return fallback;
    }
    return level;
}

void Logger::shutdown() {
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace prism
