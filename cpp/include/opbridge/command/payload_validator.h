#ifndef OPBRIDGE_COMMAND_PAYLOAD_VALIDATOR_H
#define OPBRIDGE_COMMAND_PAYLOAD_VALIDATOR_H

#include <opbridge/opbridge_export.h>
#include <opbridge/types/value/dynamic_value.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace opbridge {

    struct OPBRIDGE_EXPORT ValidationResult {
        bool is_valid{true};
        std::vector<std::string> errors;
        // When set, replaces the payload handed to the operation
        std::optional<value::Mapping> normalized_payload;

        static ValidationResult success(std::optional<value::Mapping> normalized_payload = std::nullopt);
        static ValidationResult failure(std::vector<std::string> errors);

        void add_error(std::string error);
    };

    /**
     * PayloadValidator - Checks an operation payload before dispatch
     */
    class OPBRIDGE_EXPORT PayloadValidator {
    public:
        virtual ~PayloadValidator() = default;

        [[nodiscard]] virtual ValidationResult validate(const value::Mapping& payload,
                                                        std::string_view operation) const = 0;
    };

    enum class ParameterKind : uint8_t {
        Any,
        Bool,
        Integer,
        Number,
        String,
        Mapping,
        Sequence,
    };

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(ParameterKind kind);

    using CustomValidator = std::function<void(const value::Mapping& payload, ValidationResult& result)>;

    /**
     * OperationSchema - Declares the parameters of one operation
     *
     *   OperationSchema{}
     *       .require("path", ParameterKind::String)
     *       .parameter("maxResults", ParameterKind::Integer, 1000)
     *       .validator([](const Mapping& payload, ValidationResult& result) { ... });
     */
    struct OPBRIDGE_EXPORT OperationSchema {
        std::vector<std::string> required;
        std::map<std::string, ParameterKind, std::less<>> parameter_kinds;
        value::Mapping default_values;
        std::vector<CustomValidator> custom_validators;
        std::string description;

        OperationSchema& require(std::string name, ParameterKind kind = ParameterKind::Any);

        // An optional parameter; a null default means the parameter is left absent
        OperationSchema& parameter(std::string name, ParameterKind kind, value::DynamicValue default_value = {});

        OperationSchema& validator(CustomValidator fn);

        OperationSchema& describe(std::string text);
    };

    /**
     * StandardPayloadValidator - Schema driven PayloadValidator
     *
     * Operations without a schema pass unchanged. For the others, required
     * parameters must be present and non-null, typed parameters are normalized
     * (wire numbers and strings are loosened to the declared kind), absent
     * parameters with a default are filled in, and custom validators run last
     * against the normalized payload.
     */
    class OPBRIDGE_EXPORT StandardPayloadValidator : public PayloadValidator {
    public:
        // Replaces any schema already registered for ``operation``
        void register_operation(std::string operation, OperationSchema schema);

        [[nodiscard]] const OperationSchema* schema(std::string_view operation) const;
        [[nodiscard]] bool has_schema(std::string_view operation) const { return schema(operation) != nullptr; }

        [[nodiscard]] ValidationResult validate(const value::Mapping& payload,
                                                std::string_view operation) const override;

        // Throws ConversionError when ``value`` cannot be read as ``kind``
        [[nodiscard]] static value::DynamicValue normalize(const value::DynamicValue& value, ParameterKind kind);

    private:
        std::unordered_map<std::string, OperationSchema> _schemas;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_COMMAND_PAYLOAD_VALIDATOR_H
