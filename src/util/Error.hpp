/**
 * @file Error.hpp
 * @brief Error taxonomy shared by the sanitization engine
 *
 * Every fallible engine operation returns std::expected<T, util::Error>.
 * The kind decides how the orchestrator reacts (fatal, fallback, retry).
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of engine failures
 */
enum class ErrorKind {
    CONFIGURATION,          ///< Unknown standard, invalid config or record
    SAFETY_VIOLATION,       ///< Protected or invalid device, missing confirmation
    ACCESS_DENIED,          ///< Access path unusable (sharing violation, permissions)
    DEVICE_IO,              ///< Read/write failure or chunk timeout
    OUT_OF_RANGE,           ///< Offset/length outside device capacity
    UNSUPPORTED,            ///< Operation not offered by this access path
    VERIFICATION_FAILED,    ///< Read-back data differs from the expected pattern
    CANCELLATION_REQUESTED  ///< Cooperative cancellation observed
};

/**
 * @struct Error
 * @brief Represents an error with a kind, message and optional code/offset
 */
struct Error {
    ErrorKind kind = ErrorKind::DEVICE_IO;
    std::string message;
    int code = 0;                         ///< errno or process exit status, 0 if none
    std::optional<uint64_t> offset;       ///< Device offset the error refers to
    bool transient = false;               ///< Whether a retry may succeed

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : kind(err_kind), message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] static auto configuration(std::string msg) -> Error {
        return Error{ErrorKind::CONFIGURATION, std::move(msg)};
    }

    [[nodiscard]] static auto safety(std::string msg) -> Error {
        return Error{ErrorKind::SAFETY_VIOLATION, std::move(msg)};
    }

    [[nodiscard]] static auto access_denied(std::string msg, int err_code = 0) -> Error {
        return Error{ErrorKind::ACCESS_DENIED, std::move(msg), err_code};
    }

    [[nodiscard]] static auto device_io(std::string msg, int err_code = 0,
                                        bool is_transient = true) -> Error {
        Error err{ErrorKind::DEVICE_IO, std::move(msg), err_code};
        err.transient = is_transient;
        return err;
    }

    [[nodiscard]] static auto out_of_range(uint64_t at, uint64_t length, uint64_t capacity)
        -> Error {
        Error err{ErrorKind::OUT_OF_RANGE,
                  "Range [" + std::to_string(at) + ", +" + std::to_string(length) +
                      ") exceeds capacity " + std::to_string(capacity)};
        err.offset = at;
        return err;
    }

    [[nodiscard]] static auto unsupported(std::string msg) -> Error {
        return Error{ErrorKind::UNSUPPORTED, std::move(msg)};
    }

    [[nodiscard]] static auto verification_failed(uint64_t at) -> Error {
        Error err{ErrorKind::VERIFICATION_FAILED,
                  "Verification failed at offset " + std::to_string(at)};
        err.offset = at;
        return err;
    }

    [[nodiscard]] static auto cancelled() -> Error {
        return Error{ErrorKind::CANCELLATION_REQUESTED, "Operation was cancelled by user"};
    }

    auto operator==(const Error&) const -> bool = default;
};

/**
 * @brief Stable identifier for an error kind (used in logs and records)
 */
[[nodiscard]] inline auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ErrorKind::SAFETY_VIOLATION:
            return "SafetyViolation";
        case ErrorKind::ACCESS_DENIED:
            return "AccessDenied";
        case ErrorKind::DEVICE_IO:
            return "DeviceIOError";
        case ErrorKind::OUT_OF_RANGE:
            return "OutOfRangeError";
        case ErrorKind::UNSUPPORTED:
            return "Unsupported";
        case ErrorKind::VERIFICATION_FAILED:
            return "VerificationFailed";
        case ErrorKind::CANCELLATION_REQUESTED:
            return "CancellationRequested";
    }
    return "Unknown";
}

/**
 * @brief Parse an identifier produced by to_string(ErrorKind)
 */
[[nodiscard]] inline auto error_kind_from_string(std::string_view name)
    -> std::optional<ErrorKind> {
    for (auto kind : {ErrorKind::CONFIGURATION, ErrorKind::SAFETY_VIOLATION,
                      ErrorKind::ACCESS_DENIED, ErrorKind::DEVICE_IO, ErrorKind::OUT_OF_RANGE,
                      ErrorKind::UNSUPPORTED, ErrorKind::VERIFICATION_FAILED,
                      ErrorKind::CANCELLATION_REQUESTED}) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace util
