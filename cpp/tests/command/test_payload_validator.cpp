/**
 * Unit tests for OperationSchema and StandardPayloadValidator
 */

#include <catch2/catch_test_macros.hpp>
#include <opbridge/command/payload_validator.h>
#include <opbridge/types/error_type.h>

using namespace opbridge;
using namespace opbridge::value;

namespace {

    StandardPayloadValidator make_validator() {
        StandardPayloadValidator validator;
        validator.register_operation("find", OperationSchema{}
                                                 .require("pattern", ParameterKind::String)
                                                 .parameter("useRegex", ParameterKind::Bool, false)
                                                 .parameter("maxResults", ParameterKind::Integer, 1000)
                                                 .describe("Find objects by name"));
        return validator;
    }

}  // namespace

TEST_CASE("StandardPayloadValidator - operations without a schema pass unchanged", "[command][validator]") {
    auto validator = make_validator();
    Mapping payload{{"operation", "inspect"}, {"anything", Sequence{1}}};

    auto result = validator.validate(payload, "inspect");

    REQUIRE(result.is_valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.normalized_payload == payload);
}

TEST_CASE("StandardPayloadValidator - defaults fill absent parameters", "[command][validator]") {
    auto validator = make_validator();

    auto result = validator.validate(Mapping{{"pattern", "Cube*"}}, "find");

    REQUIRE(result.is_valid);
    const auto& normalized = *result.normalized_payload;
    REQUIRE(normalized.at("pattern") == DynamicValue("Cube*"));
    REQUIRE(normalized.at("useRegex") == DynamicValue(false));
    REQUIRE(normalized.at("maxResults") == DynamicValue(1000));
}

TEST_CASE("StandardPayloadValidator - wire values are loosened to the declared kind", "[command][validator]") {
    auto validator = make_validator();

    auto result = validator.validate(Mapping{{"pattern", 12}, {"useRegex", "TRUE"}, {"maxResults", 25.0}}, "find");

    REQUIRE(result.is_valid);
    const auto& normalized = *result.normalized_payload;
    REQUIRE(normalized.at("pattern") == DynamicValue("12"));
    REQUIRE(normalized.at("useRegex") == DynamicValue(true));
    REQUIRE(normalized.at("maxResults").is_int());
    REQUIRE(normalized.at("maxResults") == DynamicValue(25));
}

TEST_CASE("StandardPayloadValidator - missing and null required parameters", "[command][validator]") {
    auto validator = make_validator();

    auto missing = validator.validate(Mapping{}, "find");
    REQUIRE_FALSE(missing.is_valid);
    REQUIRE(missing.errors == std::vector<std::string>{"Required parameter 'pattern' is missing"});

    auto null = validator.validate(Mapping{{"pattern", nullptr}}, "find");
    REQUIRE_FALSE(null.is_valid);
    REQUIRE(null.errors == std::vector<std::string>{"Required parameter 'pattern' cannot be null"});
}

TEST_CASE("StandardPayloadValidator - type errors are collected", "[command][validator]") {
    auto validator = make_validator();

    auto result = validator.validate(Mapping{{"pattern", "x"}, {"useRegex", 3}, {"maxResults", 2.5}}, "find");

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 2);
    REQUIRE(result.errors[0] == "Parameter 'maxResults' type error: Cannot convert '2.5' to Integer");
    REQUIRE(result.errors[1] == "Parameter 'useRegex' type error: Cannot convert '3' to Bool");
}

TEST_CASE("StandardPayloadValidator - custom validators see the normalized payload", "[command][validator]") {
    StandardPayloadValidator validator;
    validator.register_operation(
        "resize", OperationSchema{}
                      .parameter("width", ParameterKind::Integer)
                      .validator([](const Mapping& payload, ValidationResult& result) {
                          auto* width = payload.contains("width") ? &payload.at("width") : nullptr;
                          if (width != nullptr && width->as_int() <= 0) result.add_error("width must be positive");
                      })
                      .validator([](const Mapping&, ValidationResult&) { throw std::runtime_error("boom"); }));

    auto result = validator.validate(Mapping{{"width", "-4"}}, "resize");

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.errors == std::vector<std::string>{"width must be positive", "Custom validation error: boom"});
}

TEST_CASE("StandardPayloadValidator - registering again replaces the schema", "[command][validator]") {
    auto validator = make_validator();
    REQUIRE(validator.has_schema("find"));
    REQUIRE(validator.schema("find")->description == "Find objects by name");

    validator.register_operation("find", OperationSchema{});

    REQUIRE(validator.validate(Mapping{}, "find").is_valid);
    REQUIRE_FALSE(validator.has_schema("inspect"));
    REQUIRE_THROWS_AS(validator.register_operation("", OperationSchema{}), std::invalid_argument);
    REQUIRE_THROWS_AS(OperationSchema{}.validator(CustomValidator{}), std::invalid_argument);
}

TEST_CASE("StandardPayloadValidator - normalize", "[command][validator]") {
    using K = ParameterKind;

    REQUIRE(StandardPayloadValidator::normalize(DynamicValue(" 42 "), K::Integer) == DynamicValue(42));
    REQUIRE(StandardPayloadValidator::normalize(DynamicValue("1.5"), K::Number) == DynamicValue(1.5));
    REQUIRE(StandardPayloadValidator::normalize(DynamicValue(3), K::Number) == DynamicValue(3));
    REQUIRE(StandardPayloadValidator::normalize(DynamicValue(true), K::String) == DynamicValue("true"));
    REQUIRE(StandardPayloadValidator::normalize(DynamicValue(Sequence{1}), K::Any) == DynamicValue(Sequence{1}));

    REQUIRE_THROWS_AS(StandardPayloadValidator::normalize(DynamicValue("many"), K::Integer), ConversionError);
    REQUIRE_THROWS_AS(StandardPayloadValidator::normalize(DynamicValue(1), K::Mapping), ConversionError);
    REQUIRE_THROWS_AS(StandardPayloadValidator::normalize(DynamicValue(Mapping{}), K::Sequence), ConversionError);
    REQUIRE(to_string(K::Sequence) == "Sequence");
}

TEST_CASE("ValidationResult - factories", "[command][validator]") {
    REQUIRE(ValidationResult::success().is_valid);
    REQUIRE_FALSE(ValidationResult::success().normalized_payload.has_value());

    auto failed = ValidationResult::failure({"a", "b"});
    REQUIRE_FALSE(failed.is_valid);
    REQUIRE(failed.errors.size() == 2);

    ValidationResult result;
    result.add_error("x");
    REQUIRE_FALSE(result.is_valid);
}
