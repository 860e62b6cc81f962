/**
 * @file status.cpp
 * @brief Status formatting
 */

#include "prism/status.hpp"

#include <fmt/format.h>

namespace prism {

std::string_view status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::kOk:              return "OK";
        case StatusCode::kError:           return "Error";
        case StatusCode::kNotFound:        return "NotFound";
        case StatusCode::kInvalidArgument: return "InvalidArgument";
        case StatusCode::kOutOfRange:      return "OutOfRange";
        case StatusCode::kInvalidState:    return "InvalidState";
        case StatusCode::kIOError:         return "IOError";
        case StatusCode::kCorruption:      return "Corruption";
        case StatusCode::kNotSupported:    return "NotSupported";
        case StatusCode::kBusy:            return "Busy";
        case StatusCode::kTimeout:         return "Timeout";
        case StatusCode::kAborted:         return "Aborted";
        case StatusCode::kInternal:        return "Internal";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return std::string(status_code_name(code_));
    }
    return fmt::format("{}: {}", status_code_name(code_), message_);
}

}  // namespace prism
