#pragma once

/**
 * @file status.hpp
 * @brief Internal status implementation
 *
 * This file re-exports the public status.hpp and adds internal utilities.
 */

#include <stdexcept>
#include <string>

#include "prism/status.hpp"

namespace prism {

/**
 * @brief Thrown when an accessor is used while the iterator is not
 *        positioned on a tuple (before the first advance, after
 *        exhaustion, or after close)
 */
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Macro to return early if status is not OK
 */
#define PRISM_RETURN_IF_ERROR(expr)     \
    do {                                \
        auto _status = (expr);          \
        if (!_status.ok()) {            \
            return _status;             \
        }                               \
    } while (false)

}  // namespace prism
