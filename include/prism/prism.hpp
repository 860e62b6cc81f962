#pragma once

/**
 * @file prism.hpp
 * @brief Main include header for Prism
 *
 * Include this single header to access the public API of Prism.
 */

#include "prism/status.hpp"

namespace prism {

/**
 * @brief Get the version string of Prism
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

}  // namespace prism
