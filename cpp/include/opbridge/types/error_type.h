#ifndef OPBRIDGE_TYPES_ERROR_TYPE_H
#define OPBRIDGE_TYPES_ERROR_TYPE_H

#include <opbridge/opbridge_export.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opbridge {

    /**
     * Root of the error taxonomy surfaced through the failure envelope
     * ``{success: false, error, errorType, category}``.
     *
     * ``error_type()`` is the value reported as ``errorType``.
     */
    struct OPBRIDGE_EXPORT BridgeError : std::runtime_error {
        using std::runtime_error::runtime_error;

        [[nodiscard]] virtual std::string_view error_type() const noexcept { return "BridgeError"; }
    };

    /**
     * Malformed or missing payload fields. ``errors`` holds the field-level messages
     * when the error was produced by a payload validator.
     */
    struct OPBRIDGE_EXPORT ValidationError : BridgeError {
        explicit ValidationError(const std::string &message) : BridgeError(message) {}
        ValidationError(const std::string &message, std::vector<std::string> errors)
            : BridgeError(message), errors(std::move(errors)) {}

        [[nodiscard]] std::string_view error_type() const noexcept override { return "ValidationError"; }

        std::vector<std::string> errors;
    };

    struct OPBRIDGE_EXPORT UnsupportedOperationError : BridgeError {
        using BridgeError::BridgeError;

        [[nodiscard]] std::string_view error_type() const noexcept override { return "UnsupportedOperationError"; }
    };

    struct OPBRIDGE_EXPORT TargetNotFoundError : BridgeError {
        using BridgeError::BridgeError;

        [[nodiscard]] std::string_view error_type() const noexcept override { return "TargetNotFoundError"; }
    };

    // Absorbed by the conversion engine, never reaches the failure envelope on its own.
    struct OPBRIDGE_EXPORT ConversionError : BridgeError {
        using BridgeError::BridgeError;

        [[nodiscard]] std::string_view error_type() const noexcept override { return "ConversionError"; }
    };

    struct OPBRIDGE_EXPORT HandlerExecutionError : BridgeError {
        using BridgeError::BridgeError;

        [[nodiscard]] std::string_view error_type() const noexcept override { return "HandlerExecutionError"; }
    };

    /**
     * The ``errorType`` reported for an arbitrary exception: the taxonomy name for
     * BridgeError and its subclasses, HandlerExecutionError for anything else.
     */
    [[nodiscard]] OPBRIDGE_EXPORT std::string_view error_type_name(const std::exception &e) noexcept;

}  // namespace opbridge

#endif  // OPBRIDGE_TYPES_ERROR_TYPE_H
