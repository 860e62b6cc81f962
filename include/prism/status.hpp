#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for the Prism query iterators
 */

#include <string>
#include <string_view>

namespace prism {

/**
 * @brief Status codes for iterator and storage operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kInvalidArgument,
    kOutOfRange,
    kInvalidState,
    kIOError,
    kCorruption,
    kNotSupported,
    kBusy,
    kTimeout,
    kAborted,
    kInternal,
};

/// Name of a status code as it appears in Status::to_string()
[[nodiscard]] std::string_view status_code_name(StatusCode code) noexcept;

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 * Iterators stacked in a plan hand a child's Status to their caller
 * unchanged, so the code seen at the top is the one the storage layer set.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status OutOfRange(std::string msg = "") { return Status(StatusCode::kOutOfRange, std::move(msg)); }
    [[nodiscard]] static Status InvalidState(std::string msg = "") { return Status(StatusCode::kInvalidState, std::move(msg)); }
    [[nodiscard]] static Status IOError(std::string msg = "") { return Status(StatusCode::kIOError, std::move(msg)); }
    [[nodiscard]] static Status Corruption(std::string msg = "") { return Status(StatusCode::kCorruption, std::move(msg)); }
    [[nodiscard]] static Status NotSupported(std::string msg = "") { return Status(StatusCode::kNotSupported, std::move(msg)); }
    [[nodiscard]] static Status Busy(std::string msg = "") { return Status(StatusCode::kBusy, std::move(msg)); }
    [[nodiscard]] static Status Timeout(std::string msg = "") { return Status(StatusCode::kTimeout, std::move(msg)); }
    [[nodiscard]] static Status Aborted(std::string msg = "") { return Status(StatusCode::kAborted, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool is_io_error() const noexcept { return code_ == StatusCode::kIOError; }
    [[nodiscard]] bool is_invalid_state() const noexcept { return code_ == StatusCode::kInvalidState; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Status& other) const noexcept {
        return code_ == other.code_ && message_ == other.message_;
    }

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace prism
