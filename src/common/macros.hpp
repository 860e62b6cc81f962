#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for Prism
 */

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>

namespace prism {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Check an internal invariant (debug builds only)
 *
 * Failures report the condition, message and call site on stderr and abort.
 * Not for input validation: iterators report misuse through Status or
 * exceptions.
 */
#ifdef NDEBUG
#define PRISM_ASSERT(condition, message) ((void)0)
#else
#define PRISM_ASSERT(condition, message)                                      \
    do {                                                                      \
        if (!(condition)) {                                                   \
            fmt::print(stderr, "{}:{}: {}: invariant `{}` violated: {}\n",   \
                       __FILE__, __LINE__, __func__, #condition, (message));  \
            std::abort();                                                     \
        }                                                                     \
    } while (false)
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define PRISM_DISALLOW_COPY(ClassName)             \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define PRISM_DISALLOW_MOVE(ClassName)             \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define PRISM_DISALLOW_COPY_AND_MOVE(ClassName)    \
    PRISM_DISALLOW_COPY(ClassName);                \
    PRISM_DISALLOW_MOVE(ClassName)

}  // namespace prism
