#include <opbridge/command/payload_validator.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/string_utils.h>

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

namespace opbridge {

    using value::DynamicKind;
    using value::DynamicValue;
    using value::Mapping;

    ValidationResult ValidationResult::success(std::optional<Mapping> normalized_payload) {
        return {.is_valid = true, .errors = {}, .normalized_payload = std::move(normalized_payload)};
    }

    ValidationResult ValidationResult::failure(std::vector<std::string> errors) {
        return {.is_valid = false, .errors = std::move(errors), .normalized_payload = std::nullopt};
    }

    void ValidationResult::add_error(std::string error) {
        errors.push_back(std::move(error));
        is_valid = false;
    }

    std::string_view to_string(ParameterKind kind) {
        switch (kind) {
            case ParameterKind::Any: return "Any";
            case ParameterKind::Bool: return "Bool";
            case ParameterKind::Integer: return "Integer";
            case ParameterKind::Number: return "Number";
            case ParameterKind::String: return "String";
            case ParameterKind::Mapping: return "Mapping";
            case ParameterKind::Sequence: return "Sequence";
        }
        return "Unknown";
    }

    // ============================================================================
    // OperationSchema
    // ============================================================================

    OperationSchema &OperationSchema::require(std::string name, ParameterKind kind) {
        parameter_kinds.insert_or_assign(name, kind);
        required.push_back(std::move(name));
        return *this;
    }

    OperationSchema &OperationSchema::parameter(std::string name, ParameterKind kind, DynamicValue default_value) {
        if (!default_value.is_null()) default_values.insert_or_assign(name, std::move(default_value));
        parameter_kinds.insert_or_assign(std::move(name), kind);
        return *this;
    }

    OperationSchema &OperationSchema::validator(CustomValidator fn) {
        if (!fn) throw std::invalid_argument("OperationSchema::validator: validator is empty");
        custom_validators.push_back(std::move(fn));
        return *this;
    }

    OperationSchema &OperationSchema::describe(std::string text) {
        description = std::move(text);
        return *this;
    }

    // ============================================================================
    // StandardPayloadValidator
    // ============================================================================

    void StandardPayloadValidator::register_operation(std::string operation, OperationSchema schema) {
        if (operation.empty()) throw std::invalid_argument("StandardPayloadValidator::register_operation: operation is empty");
        _schemas.insert_or_assign(std::move(operation), std::move(schema));
    }

    const OperationSchema *StandardPayloadValidator::schema(std::string_view operation) const {
        auto it = _schemas.find(std::string(operation));
        return it != _schemas.end() ? &it->second : nullptr;
    }

    DynamicValue StandardPayloadValidator::normalize(const DynamicValue &value, ParameterKind kind) {
        switch (kind) {
            case ParameterKind::Any: return value;
            case ParameterKind::Bool:
                if (value.is_bool()) return value;
                if (value.is_string()) {
                    auto text = trim(value.as_string());
                    if (iequals(text, "true")) return true;
                    if (iequals(text, "false")) return false;
                }
                throw_error<ConversionError>("Cannot convert '{}' to Bool", value.to_string());
            case ParameterKind::Integer:
                if (value.is_int()) return value;
                if (value.is_float()) {
                    const double number = value.as_float();
                    if (std::isfinite(number) && std::trunc(number) == number && std::abs(number) < 9.0e18) {
                        return static_cast<int64_t>(number);
                    }
                } else if (value.is_string()) {
                    if (auto parsed = parse_int64(value.as_string()); parsed.has_value()) return *parsed;
                }
                throw_error<ConversionError>("Cannot convert '{}' to Integer", value.to_string());
            case ParameterKind::Number:
                if (value.is_number()) return value;
                if (value.is_string()) {
                    if (auto parsed = parse_double(value.as_string()); parsed.has_value()) return *parsed;
                }
                throw_error<ConversionError>("Cannot convert '{}' to Number", value.to_string());
            case ParameterKind::String:
                if (value.is_string()) return value;
                return value.to_string();
            case ParameterKind::Mapping:
                if (value.is_mapping()) return value;
                throw_error<ConversionError>("Cannot convert '{}' to Mapping", value.to_string());
            case ParameterKind::Sequence:
                if (value.is_sequence()) return value;
                throw_error<ConversionError>("Cannot convert '{}' to Sequence", value.to_string());
        }
        return value;
    }

    ValidationResult StandardPayloadValidator::validate(const Mapping &payload, std::string_view operation) const {
        const auto *found = schema(operation);
        if (found == nullptr) return ValidationResult::success(payload);

        ValidationResult result = ValidationResult::success(payload);
        auto &normalized = *result.normalized_payload;

        for (const auto &name : found->required) {
            auto it = payload.find(name);
            if (it == payload.end()) {
                result.add_error(fmt::format("Required parameter '{}' is missing", name));
            } else if (it->second.is_null()) {
                result.add_error(fmt::format("Required parameter '{}' cannot be null", name));
            }
        }

        for (const auto &[name, kind] : found->parameter_kinds) {
            auto it = payload.find(name);
            if (it == payload.end()) {
                if (auto fallback = found->default_values.find(name); fallback != found->default_values.end()) {
                    normalized.insert_or_assign(name, fallback->second);
                }
                continue;
            }
            if (it->second.is_null()) continue;
            try {
                normalized.insert_or_assign(name, normalize(it->second, kind));
            } catch (const std::exception &e) {
                result.add_error(fmt::format("Parameter '{}' type error: {}", name, e.what()));
            }
        }

        for (const auto &custom : found->custom_validators) {
            try {
                custom(normalized, result);
            } catch (const std::exception &e) {
                result.add_error(fmt::format("Custom validation error: {}", e.what()));
            }
        }
        return result;
    }

}  // namespace opbridge
